#include "sol_util.h"

#include "doctest/doctest.h"

#include <string>

namespace {

sol::table run_chunk(sol::state &lua, char const *chunk) {
  lua.script(chunk);
  return lua.globals();
}

}  // namespace

TEST_CASE("sol_util_make_lua_state opens standard libraries") {
  auto lua{ strata::sol_util_make_lua_state() };
  REQUIRE(lua);
  CHECK(lua->script("return string.upper('post')").get<std::string>() == "POST");
  CHECK(lua->script("return math.max(3, 7)").get<int>() == 7);
  CHECK(lua->script("return type(os.getenv)").get<std::string>() == "function");
}

TEST_CASE("sol_util_get_optional") {
  auto lua{ strata::sol_util_make_lua_state() };
  auto const globals{ run_chunk(*lua, "NAME = 'images'; COUNT = 10; FLAG = true") };

  SUBCASE("present values") {
    CHECK(strata::sol_util_get_optional<std::string>(globals, "NAME", "cfg") == "images");
    CHECK(strata::sol_util_get_optional<int>(globals, "COUNT", "cfg") == 10);
    CHECK(strata::sol_util_get_optional<bool>(globals, "FLAG", "cfg") == true);
  }

  SUBCASE("absent value") {
    CHECK_FALSE(strata::sol_util_get_optional<std::string>(globals, "MISSING", "cfg"));
  }

  SUBCASE("number is not a string") {
    CHECK_THROWS_AS(strata::sol_util_get_optional<std::string>(globals, "COUNT", "cfg"),
                    strata::configuration_error);
  }

  SUBCASE("string is not a number") {
    CHECK_THROWS_AS(strata::sol_util_get_optional<int>(globals, "NAME", "cfg"),
                    strata::configuration_error);
  }
}

TEST_CASE("sol_util_get_required") {
  auto lua{ strata::sol_util_make_lua_state() };
  auto const globals{ run_chunk(*lua, "NAME = 'images'") };

  CHECK(strata::sol_util_get_required<std::string>(globals, "NAME", "cfg") == "images");

  try {
    strata::sol_util_get_required<std::string>(globals, "ROLE", "FUNCTIONS[1]");
    FAIL("expected configuration_error");
  } catch (strata::configuration_error const &e) {
    CHECK(std::string(e.what()) == "FUNCTIONS[1]: ROLE is required");
  }
}

TEST_CASE("sol_util_get_string_map") {
  auto lua{ strata::sol_util_make_lua_state() };

  SUBCASE("strings and integers") {
    auto const globals{ run_chunk(*lua, "ENV = { PAGE_SIZE = 10, MODE = 'fast' }") };
    auto const env{ strata::sol_util_get_string_map(globals, "ENV", "cfg") };
    REQUIRE(env.has_value());
    CHECK(env->size() == 2);
    CHECK(env->at("PAGE_SIZE") == "10");
    CHECK(env->at("MODE") == "fast");
  }

  SUBCASE("absent table") {
    auto const globals{ run_chunk(*lua, "X = 1") };
    CHECK_FALSE(strata::sol_util_get_string_map(globals, "ENV", "cfg"));
  }

  SUBCASE("non-table value") {
    auto const globals{ run_chunk(*lua, "ENV = 'PAGE_SIZE=10'") };
    CHECK_THROWS_AS(strata::sol_util_get_string_map(globals, "ENV", "cfg"),
                    strata::configuration_error);
  }

  SUBCASE("boolean value") {
    auto const globals{ run_chunk(*lua, "ENV = { DEBUG = true }") };
    CHECK_THROWS_AS(strata::sol_util_get_string_map(globals, "ENV", "cfg"),
                    strata::configuration_error);
  }
}
