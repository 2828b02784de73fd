#pragma once

#include <optional>
#include <string>

namespace strata::platform {

// Returns nullopt when the variable is unset; an empty value is returned as "".
std::optional<std::string> get_env_var(char const *name);
void set_env_var(char const *name, char const *value);
void unset_env_var(char const *name);

}  // namespace strata::platform
