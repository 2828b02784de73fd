#include "platform.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace strata::platform {

std::optional<std::string> get_env_var(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("get_env_var: null name"); }
  if (char const *value{ std::getenv(name) }) { return std::string{ value }; }
  return std::nullopt;
}

void set_env_var(char const *name, char const *value) {
  if (name == nullptr || value == nullptr) {
    throw std::invalid_argument("set_env_var: null name or value");
  }

  if (::setenv(name, value, 1) != 0) {
    throw std::runtime_error(std::string("set_env_var: failed to set ") + name + ": " +
                             std::strerror(errno));
  }
}

void unset_env_var(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("unset_env_var: null name"); }

  if (::unsetenv(name) != 0) {
    throw std::runtime_error(std::string("unset_env_var: failed to unset ") + name + ": " +
                             std::strerror(errno));
  }
}

}  // namespace strata::platform
