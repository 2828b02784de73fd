#include "errors.h"

#include <utility>

namespace strata {

namespace {

std::string format_remote(std::string const &operation,
                          std::string const &code,
                          std::string const &message) {
  std::string out{ operation };
  out.append(" failed");
  if (!code.empty()) { out.append(" (" + code + ")"); }
  if (!message.empty()) { out.append(": " + message); }
  return out;
}

}  // namespace

remote_error::remote_error(std::string operation,
                           std::string code,
                           std::string const &message)
    : std::runtime_error{ format_remote(operation, code, message) },
      operation_{ std::move(operation) },
      code_{ std::move(code) } {}

readiness_timeout::readiness_timeout(std::string api_id, int attempts)
    : std::runtime_error{ "API " + api_id + " not readable after " +
                          std::to_string(attempts) + " attempts" },
      api_id_{ std::move(api_id) },
      attempts_{ attempts } {}

std::string_view failure_kind_name(failure_kind kind) {
  switch (kind) {
    case failure_kind::REMOTE: return "remote error";
    case failure_kind::CONFLICT: return "creation conflict";
    case failure_kind::READINESS_TIMEOUT: return "readiness timeout";
    case failure_kind::CONFIGURATION: return "configuration error";
    case failure_kind::OTHER: return "error";
  }
  return "error";
}

convergence_error::convergence_error(std::string step,
                                     std::string resource_key,
                                     failure_kind kind,
                                     std::string const &cause)
    : std::runtime_error{ step + " [" + resource_key + "] " +
                          std::string(failure_kind_name(kind)) + ": " + cause },
      step_{ std::move(step) },
      resource_key_{ std::move(resource_key) },
      kind_{ kind } {}

}  // namespace strata
