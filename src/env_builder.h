#pragma once

#include "resource.h"

#include <map>
#include <string>
#include <string_view>

namespace strata {

// Assembles a function's environment: deployment-wide base variables merged with
// that function's overrides. ${NAME} references in any value are expanded against
// the deployment variables before the merge, so an override never sees another
// function's values.
class env_builder {
 public:
  env_builder(env_map base, env_map variables, std::map<std::string, env_map> overrides);

  // Throws configuration_error on an unknown reference or unterminated "${".
  std::string expand(std::string_view value) const;

  // Merged, expanded and validated map. Throws configuration_error.
  env_map build(std::string const &function_name) const;

  // {"Variables":{...}} rendering of a merged map.
  static std::string document(env_map const &env);

  // Key grammar [A-Za-z_][A-Za-z0-9_]*, and the rendered document must re-parse to
  // exactly the same entries.
  static void validate(env_map const &env);

 private:
  env_map base_;
  env_map variables_;
  std::map<std::string, env_map> overrides_;
};

}  // namespace strata
