#include "env_builder.h"

#include "aws_util.h"
#include "errors.h"

#include "aws/core/utils/json/JsonSerializer.h"

#include <cctype>

namespace strata {

namespace {

bool valid_name(std::string_view name) {
  if (name.empty()) { return false; }
  if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') {
    return false;
  }
  for (char const c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') { return false; }
  }
  return true;
}

env_map expand_all(env_builder const &builder, env_map const &values) {
  env_map out;
  for (auto const &[k, v] : values) { out.emplace(k, builder.expand(v)); }
  return out;
}

}  // namespace

env_builder::env_builder(env_map base,
                         env_map variables,
                         std::map<std::string, env_map> overrides)
    : base_{ std::move(base) },
      variables_{ std::move(variables) },
      overrides_{ std::move(overrides) } {}

std::string env_builder::expand(std::string_view value) const {
  std::string out;
  out.reserve(value.size());

  std::size_t pos{ 0 };
  while (pos < value.size()) {
    auto const open{ value.find("${", pos) };
    if (open == std::string_view::npos) {
      out.append(value.substr(pos));
      break;
    }
    out.append(value.substr(pos, open - pos));

    auto const close{ value.find('}', open + 2) };
    if (close == std::string_view::npos) {
      throw configuration_error("unterminated variable reference in '" +
                                std::string(value) + "'");
    }

    std::string const name{ value.substr(open + 2, close - open - 2) };
    auto const it{ variables_.find(name) };
    if (!valid_name(name) || it == variables_.end()) {
      throw configuration_error("unknown variable '${" + name + "}' in '" +
                                std::string(value) + "'");
    }
    out.append(it->second);
    pos = close + 1;
  }
  return out;
}

env_map env_builder::build(std::string const &function_name) const {
  auto merged{ expand_all(*this, base_) };

  if (auto const it{ overrides_.find(function_name) }; it != overrides_.end()) {
    for (auto &[k, v] : expand_all(*this, it->second)) { merged[k] = std::move(v); }
  }

  validate(merged);
  return merged;
}

std::string env_builder::document(env_map const &env) {
  Aws::Utils::Json::JsonValue variables;
  for (auto const &[k, v] : env) { variables.WithString(aws_str(k), aws_str(v)); }

  Aws::Utils::Json::JsonValue doc;
  doc.WithObject("Variables", std::move(variables));
  return std_str(doc.View().WriteCompact());
}

void env_builder::validate(env_map const &env) {
  for (auto const &[k, v] : env) {
    if (!valid_name(k)) {
      throw configuration_error("invalid environment variable name '" + k + "'");
    }
  }

  Aws::Utils::Json::JsonValue const parsed{ aws_str(document(env)) };
  if (!parsed.WasParseSuccessful()) {
    throw configuration_error("environment document is malformed: " +
                              std_str(parsed.GetErrorMessage()));
  }

  auto const view{ parsed.View() };
  if (!view.KeyExists("Variables") || !view.GetObject("Variables").IsObject()) {
    throw configuration_error("environment document has no Variables object");
  }

  auto const entries{ view.GetObject("Variables").GetAllObjects() };
  if (entries.size() != env.size()) {
    throw configuration_error("environment document lost entries during rendering");
  }
  for (auto const &[k, v] : entries) {
    auto const it{ env.find(std_str(k)) };
    if (it == env.end() || !v.IsString() || std_str(v.AsString()) != it->second) {
      throw configuration_error("environment document disagrees with variable '" +
                                std_str(k) + "'");
    }
  }
}

}  // namespace strata
