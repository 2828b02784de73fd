#include "util.h"

#include "doctest/doctest.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("strata-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

}  // namespace

TEST_CASE("match with std::variant of int and string") {
  using var_t = std::variant<int, std::string>;

  var_t v1{ 42 };
  var_t v2{ std::string("hello") };

  auto const visitor{ strata::match{
      [](int x) { return x * 2; },
      [](std::string const &s) { return static_cast<int>(s.size()); } } };

  CHECK(std::visit(visitor, v1) == 84);
  CHECK(std::visit(visitor, v2) == 5);
}

TEST_CASE("util_load_file reads bytes") {
  auto const path{ make_temp_path("load") };
  {
    std::ofstream out{ path, std::ios::binary };
    out << "strata\n";
  }

  auto const bytes{ strata::util_load_file(path) };
  std::filesystem::remove(path);

  REQUIRE(bytes.size() == 7);
  CHECK(std::string(bytes.begin(), bytes.end()) == "strata\n");
}

TEST_CASE("util_load_file throws for missing file") {
  CHECK_THROWS_AS(strata::util_load_file(make_temp_path("missing")), std::runtime_error);
}

TEST_CASE("util_open_file returns null on failure") {
  auto const path{ make_temp_path("nodir") / "file.txt" };
  CHECK_FALSE(strata::util_open_file(path, "r"));
}

TEST_CASE("util_trim strips ascii whitespace") {
  CHECK(strata::util_trim("  abc \t\r\n") == "abc");
  CHECK(strata::util_trim("abc") == "abc");
  CHECK(strata::util_trim(" \t ").empty());
  CHECK(strata::util_trim("").empty());
  CHECK(strata::util_trim(" a b ") == "a b");
}

TEST_CASE("util_iequals ignores ascii case") {
  CHECK(strata::util_iequals("SQS:SendMessage", "sqs:sendmessage"));
  CHECK(strata::util_iequals("", ""));
  CHECK_FALSE(strata::util_iequals("abc", "abcd"));
  CHECK_FALSE(strata::util_iequals("abc", "abd"));
}

TEST_CASE("util_join") {
  CHECK(strata::util_join({}, ", ").empty());
  CHECK(strata::util_join({ "a" }, ", ") == "a");
  CHECK(strata::util_join({ "a", "b", "c" }, ", ") == "a, b, c");
}
