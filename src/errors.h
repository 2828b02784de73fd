#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace strata {

// Any control-plane failure other than "not found": auth, malformed request, transport.
class remote_error : public std::runtime_error {
 public:
  remote_error(std::string operation, std::string code, std::string const &message);

  std::string const &operation() const { return operation_; }
  std::string const &code() const { return code_; }

 private:
  std::string operation_;
  std::string code_;
};

// Create-time "already exists" (duplicate statement id, resource appeared mid-flight).
class creation_conflict : public remote_error {
 public:
  using remote_error::remote_error;
};

class readiness_timeout : public std::runtime_error {
 public:
  readiness_timeout(std::string api_id, int attempts);

  std::string const &api_id() const { return api_id_; }
  int attempts() const { return attempts_; }

 private:
  std::string api_id_;
  int attempts_;
};

class configuration_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class failure_kind { REMOTE, CONFLICT, READINESS_TIMEOUT, CONFIGURATION, OTHER };

std::string_view failure_kind_name(failure_kind kind);

// Terminal failure of one convergence step; names the step and the resource key.
class convergence_error : public std::runtime_error {
 public:
  convergence_error(std::string step,
                    std::string resource_key,
                    failure_kind kind,
                    std::string const &cause);

  std::string const &step() const { return step_; }
  std::string const &resource_key() const { return resource_key_; }
  failure_kind kind() const { return kind_; }

 private:
  std::string step_;
  std::string resource_key_;
  failure_kind kind_;
};

}  // namespace strata
