#pragma once

#include "errors.h"
#include "resource.h"

#include "sol/sol.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace strata {

using sol_state_ptr = std::unique_ptr<sol::state>;
sol_state_ptr sol_util_make_lua_state();  // base, string, table, math, os

namespace detail {

template <typename T>
constexpr std::string_view type_name_for_error() {
  if constexpr (std::is_same_v<T, bool>) {
    return "boolean";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return "string";
  } else if constexpr (std::is_same_v<T, sol::table>) {
    return "table";
  } else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
    return "number";
  } else {
    return "value";
  }
}

[[noreturn]] inline void throw_type_error(std::string_view context,
                                          std::string_view key,
                                          std::string_view type_name) {
  throw configuration_error(std::string(context) + ": " + std::string(key) +
                            " must be a " + std::string(type_name));
}

}  // namespace detail

template <typename T>
std::optional<T> sol_util_get_optional(sol::table const &table,
                                       std::string_view key,
                                       std::string_view context) {
  sol::optional<sol::object> obj = table[key];
  if (!obj || !obj->valid() || obj->get_type() == sol::type::lua_nil) {
    return std::nullopt;
  }

  // Lua coerces numbers to strings; config values must be spelled as written.
  if constexpr (std::is_same_v<T, std::string>) {
    if (obj->get_type() != sol::type::string) {
      detail::throw_type_error(context, key, detail::type_name_for_error<T>());
    }
  } else if (!obj->is<T>()) {
    detail::throw_type_error(context, key, detail::type_name_for_error<T>());
  }

  return obj->as<T>();
}

template <typename T>
T sol_util_get_required(sol::table const &table,
                        std::string_view key,
                        std::string_view context) {
  if (auto value{ sol_util_get_optional<T>(table, key, context) }) { return *value; }
  throw configuration_error(std::string(context) + ": " + std::string(key) +
                            " is required");
}

// String-to-string table, e.g. { PAGE_SIZE = "10" }. Numbers are accepted as values
// and rendered the way Lua's tostring would for integers.
std::optional<env_map> sol_util_get_string_map(sol::table const &table,
                                               std::string_view key,
                                               std::string_view context);

}  // namespace strata
