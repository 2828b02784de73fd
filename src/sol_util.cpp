#include "sol_util.h"

#include <cmath>

namespace strata {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::string,
                      sol::lib::table,
                      sol::lib::math,
                      sol::lib::os);
  return lua;
}

std::optional<env_map> sol_util_get_string_map(sol::table const &table,
                                               std::string_view key,
                                               std::string_view context) {
  auto const map_table{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!map_table) { return std::nullopt; }

  std::string const map_context{ std::string(context) + "." + std::string(key) };

  env_map out;
  for (auto const &[k, v] : *map_table) {
    if (k.get_type() != sol::type::string) {
      throw configuration_error(map_context + ": keys must be strings");
    }
    auto const name{ k.as<std::string>() };

    switch (v.get_type()) {
      case sol::type::string: out[name] = v.as<std::string>(); break;
      case sol::type::number: {
        double const n{ v.as<double>() };
        if (std::floor(n) != n) {
          throw configuration_error(map_context + ": " + name +
                                    " must be a string or an integer");
        }
        out[name] = std::to_string(static_cast<long long>(n));
        break;
      }
      default:
        throw configuration_error(map_context + ": " + name +
                                  " must be a string or an integer");
    }
  }
  return out;
}

}  // namespace strata
