#pragma once

#include "util.h"

#include "aws/core/Aws.h"
#include "aws/core/client/ClientConfiguration.h"

#include <optional>
#include <string>
#include <string_view>

namespace strata {

void aws_init();
void aws_shutdown();

struct aws_client_options {
  std::string region;
  std::optional<std::string> endpoint;  // e.g. http://localhost:4566
};

// Region and endpoint override applied; requests time out instead of hanging.
Aws::Client::ClientConfiguration aws_client_config(aws_client_options const &options);

inline Aws::String aws_str(std::string_view s) { return Aws::String(s.data(), s.size()); }
inline std::string std_str(Aws::String const &s) { return std::string(s.c_str(), s.size()); }

class aws_shutdown_guard : unmovable {
 public:
  aws_shutdown_guard() = default;
  ~aws_shutdown_guard();
};

}  // namespace strata
