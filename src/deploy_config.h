#pragma once

#include "resource.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

struct route_cfg {
  std::string path;         // single segment under the API root, e.g. "uploadImages"
  std::string http_method;  // upper case
};

struct function_cfg {
  std::string name;
  std::optional<route_cfg> route;  // unset for event-driven functions
  env_map env;                     // per-function overrides
  std::string handler;
  std::string runtime;
  int timeout_seconds{ 15 };
};

struct deploy_config {
  std::string region{ "us-east-1" };
  std::optional<std::string> endpoint;
  std::string account_id{ "000000000000" };

  std::string bucket;
  table_spec table;
  api_spec api;
  std::string stage;
  std::string queue;
  std::string queue_consumer;
  std::string role_arn;
  std::filesystem::path source_root{ "." };

  env_map common_env;
  std::vector<function_cfg> functions;

  // Built-in image service topology.
  static deploy_config defaults();

  // Deployment-wide names that environment values may reference as ${NAME}.
  env_map variables() const;

  function_cfg const *find_function(std::string_view name) const;
};

// "uploadImages:POST" -> { "uploadImages", "POST" }. Throws configuration_error.
route_cfg parse_route(std::string_view route);

// AWS_REGION, STRATA_ENDPOINT / AWS_ENDPOINT_URL
void deploy_config_apply_env(deploy_config &cfg);

// Evaluates a Lua config script and overlays recognized globals onto cfg.
void deploy_config_apply_lua(deploy_config &cfg,
                             std::string const &script,
                             std::string const &chunk_name);

void deploy_config_validate(deploy_config const &cfg);

// defaults -> process environment -> optional Lua file -> validate
deploy_config deploy_config_load(std::optional<std::filesystem::path> const &lua_path);

}  // namespace strata
