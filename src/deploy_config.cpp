#include "deploy_config.h"

#include "errors.h"
#include "platform.h"
#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <set>

namespace strata {

namespace {

constexpr std::array<std::string_view, 8> kHttpMethods{
  "GET", "POST", "PUT", "PATCH", "DELETE", "HEAD", "OPTIONS", "ANY"
};

constexpr char const *kDefaultRuntime{ "python3.9" };
constexpr int kDefaultTimeoutSeconds{ 15 };

std::string default_handler(std::string_view function_name) {
  return "lambdas." + std::string(function_name) + ".handler.handler";
}

function_cfg make_function(std::string name,
                           std::optional<route_cfg> route,
                           env_map env) {
  function_cfg f;
  f.handler = default_handler(name);
  f.name = std::move(name);
  f.route = std::move(route);
  f.env = std::move(env);
  f.runtime = kDefaultRuntime;
  f.timeout_seconds = kDefaultTimeoutSeconds;
  return f;
}

function_cfg parse_function(sol::table const &entry, std::size_t index) {
  std::string const context{ "FUNCTIONS[" + std::to_string(index) + "]" };

  auto name{ sol_util_get_required<std::string>(entry, "name", context) };
  std::optional<route_cfg> route;
  if (auto const r{ sol_util_get_optional<std::string>(entry, "route", context) }) {
    route = parse_route(*r);
  }

  auto f{ make_function(std::move(name),
                        std::move(route),
                        sol_util_get_string_map(entry, "env", context).value_or(env_map{})) };

  if (auto h{ sol_util_get_optional<std::string>(entry, "handler", context) }) {
    f.handler = std::move(*h);
  }
  if (auto r{ sol_util_get_optional<std::string>(entry, "runtime", context) }) {
    f.runtime = std::move(*r);
  }
  if (auto const t{ sol_util_get_optional<int>(entry, "timeout", context) }) {
    f.timeout_seconds = *t;
  }
  return f;
}

void overlay_string(sol::table const &globals, char const *key, std::string &target) {
  if (auto v{ sol_util_get_optional<std::string>(globals, key, "config") }) {
    target = std::move(*v);
  }
}

}  // namespace

deploy_config deploy_config::defaults() {
  deploy_config cfg;
  cfg.bucket = "image-service-root";
  cfg.table = table_spec{ .name = "ImagesMetadata",
                          .hash_key = "user_id",
                          .range_key = "image_id" };
  cfg.api = api_spec{ .name = "image-service-api",
                      .description = "LocalStack Image Service API" };
  cfg.stage = "local";
  cfg.queue = "image-events-queue";
  cfg.queue_consumer = "s3_listener";
  cfg.role_arn = "arn:aws:iam::000000000000:role/lambda-role";
  cfg.source_root = "src";

  cfg.common_env = { { "BUCKET_NAME", "${ROOT_BUCKET}" },
                     { "TABLE_NAME", "${TABLE_NAME}" },
                     { "LOCALSTACK_ENDPOINT", "http://localstack:4566" },
                     { "AWS_REGION", "${REGION}" } };

  cfg.functions.push_back(
      make_function("upload_images",
                    route_cfg{ "uploadImages", "POST" },
                    { { "PRESIGN_EXP", "900" }, { "UPLOAD_LIMIT", "10485760" } }));
  cfg.functions.push_back(make_function("list_images",
                                        route_cfg{ "listImages", "GET" },
                                        { { "PAGE_SIZE", "10" } }));
  cfg.functions.push_back(
      make_function("delete_images", route_cfg{ "deleteImages", "DELETE" }, {}));
  cfg.functions.push_back(make_function("s3_listener", std::nullopt, {}));
  return cfg;
}

env_map deploy_config::variables() const {
  env_map vars{ { "ROOT_BUCKET", bucket },    { "TABLE_NAME", table.name },
                { "REGION", region },         { "ACCOUNT_ID", account_id },
                { "API_NAME", api.name },     { "STAGE", stage },
                { "QUEUE_NAME", queue } };
  if (endpoint) { vars["ENDPOINT"] = *endpoint; }
  return vars;
}

function_cfg const *deploy_config::find_function(std::string_view name) const {
  auto const it{ std::find_if(functions.begin(), functions.end(), [&](auto const &f) {
    return f.name == name;
  }) };
  return it == functions.end() ? nullptr : &*it;
}

route_cfg parse_route(std::string_view route) {
  auto const pos{ route.rfind(':') };
  if (pos == std::string_view::npos) {
    throw configuration_error("route '" + std::string(route) +
                              "' must be of the form path:METHOD");
  }

  route_cfg out{ std::string(util_trim(route.substr(0, pos))),
                 std::string(util_trim(route.substr(pos + 1))) };
  std::transform(out.http_method.begin(),
                 out.http_method.end(),
                 out.http_method.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (out.path.empty() || out.path.find('/') != std::string::npos) {
    throw configuration_error("route '" + std::string(route) +
                              "': path must be a single non-empty segment");
  }
  if (std::find(kHttpMethods.begin(), kHttpMethods.end(), out.http_method) ==
      kHttpMethods.end()) {
    throw configuration_error("route '" + std::string(route) +
                              "': unsupported HTTP method '" + out.http_method + "'");
  }
  return out;
}

void deploy_config_apply_env(deploy_config &cfg) {
  if (auto region{ platform::get_env_var("AWS_REGION") }; region && !region->empty()) {
    cfg.region = std::move(*region);
  }

  for (char const *name : { "STRATA_ENDPOINT", "AWS_ENDPOINT_URL" }) {
    if (auto ep{ platform::get_env_var(name) }; ep && !ep->empty()) {
      tui::debug("Control-plane endpoint from %s: %s", name, ep->c_str());
      cfg.endpoint = std::move(*ep);
      break;
    }
  }
}

void deploy_config_apply_lua(deploy_config &cfg,
                             std::string const &script,
                             std::string const &chunk_name) {
  auto state{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error, chunk_name) };
      !result.valid()) {
    sol::error err = result;
    throw configuration_error(std::string("Failed to execute config script: ") +
                              err.what());
  }

  sol::table const globals{ state->globals() };

  overlay_string(globals, "REGION", cfg.region);
  if (auto ep{ sol_util_get_optional<std::string>(globals, "ENDPOINT", "config") }) {
    cfg.endpoint = ep->empty() ? std::nullopt : std::optional<std::string>{ *ep };
  }
  overlay_string(globals, "ACCOUNT_ID", cfg.account_id);
  overlay_string(globals, "BUCKET", cfg.bucket);
  overlay_string(globals, "TABLE", cfg.table.name);
  overlay_string(globals, "API_NAME", cfg.api.name);
  overlay_string(globals, "STAGE", cfg.stage);
  overlay_string(globals, "QUEUE", cfg.queue);
  overlay_string(globals, "QUEUE_CONSUMER", cfg.queue_consumer);
  overlay_string(globals, "ROLE_ARN", cfg.role_arn);
  if (auto root{ sol_util_get_optional<std::string>(globals, "SOURCE_ROOT", "config") }) {
    cfg.source_root = *root;
  }

  if (auto env{ sol_util_get_string_map(globals, "COMMON_ENV", "config") }) {
    cfg.common_env = std::move(*env);
  }

  if (auto const functions{
          sol_util_get_optional<sol::table>(globals, "FUNCTIONS", "config") }) {
    std::vector<function_cfg> parsed;
    for (std::size_t i{ 1 }; i <= functions->size(); ++i) {
      sol::object const entry{ functions->get<sol::object>(i) };
      if (entry.get_type() != sol::type::table) {
        throw configuration_error("FUNCTIONS[" + std::to_string(i) +
                                  "] must be a table");
      }
      parsed.push_back(parse_function(entry.as<sol::table>(), i));
    }
    cfg.functions = std::move(parsed);
  }
}

void deploy_config_validate(deploy_config const &cfg) {
  auto require_non_empty{ [](std::string const &value, char const *what) {
    if (util_trim(value).empty()) {
      throw configuration_error(std::string(what) + " must not be empty");
    }
  } };
  require_non_empty(cfg.region, "region");
  require_non_empty(cfg.bucket, "bucket name");
  require_non_empty(cfg.table.name, "table name");
  require_non_empty(cfg.api.name, "API name");
  require_non_empty(cfg.stage, "stage");
  require_non_empty(cfg.queue, "queue name");
  require_non_empty(cfg.role_arn, "role ARN");

  if (cfg.functions.empty()) { throw configuration_error("no functions declared"); }

  std::set<std::string> names;
  std::set<std::string> routes;
  for (auto const &f : cfg.functions) {
    require_non_empty(f.name, "function name");
    if (!names.insert(f.name).second) {
      throw configuration_error("function '" + f.name + "' declared more than once");
    }
    if (f.timeout_seconds <= 0) {
      throw configuration_error("function '" + f.name + "': timeout must be positive");
    }
    require_non_empty(f.handler, "function handler");
    require_non_empty(f.runtime, "function runtime");

    if (f.route) {
      parse_route(f.route->path + ":" + f.route->http_method);
      if (!routes.insert(f.route->path + ":" + f.route->http_method).second) {
        throw configuration_error("route " + f.route->http_method + " /" +
                                  f.route->path + " bound to more than one function");
      }
    }
  }

  if (!cfg.find_function(cfg.queue_consumer)) {
    throw configuration_error("queue consumer '" + cfg.queue_consumer +
                              "' is not a declared function");
  }
}

deploy_config deploy_config_load(std::optional<std::filesystem::path> const &lua_path) {
  auto cfg{ deploy_config::defaults() };
  deploy_config_apply_env(cfg);

  if (lua_path) {
    tui::debug("Loading config from file: %s", lua_path->string().c_str());
    if (!std::filesystem::exists(*lua_path)) {
      throw configuration_error("config file not found: " + lua_path->string());
    }
    auto const content{ util_load_file(*lua_path) };
    std::string const script{ reinterpret_cast<char const *>(content.data()),
                              content.size() };
    deploy_config_apply_lua(cfg, script, "@" + lua_path->string());
    if (cfg.source_root.is_relative()) {
      cfg.source_root = lua_path->parent_path() / cfg.source_root;
    }
  }

  deploy_config_validate(cfg);
  return cfg;
}

}  // namespace strata
