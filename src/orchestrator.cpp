#include "orchestrator.h"

#include "arn.h"
#include "code_package.h"
#include "env_builder.h"
#include "errors.h"
#include "publisher.h"
#include "trace.h"
#include "tui.h"

namespace strata {

orchestrator::orchestrator(deploy_config cfg,
                           control_plane &plane,
                           converge_options options,
                           code_loader_t code_loader)
    : cfg_{ std::move(cfg) },
      plane_{ plane },
      options_{ std::move(options) },
      code_loader_{ std::move(code_loader) } {
  if (!code_loader_) {
    code_loader_ = [root = cfg_.source_root](function_cfg const &f) {
      return code_package_build(root, f.name);
    };
  }
}

template <typename Fn>
auto orchestrator::step(char const *name, std::string const &key, Fn &&fn)
    -> decltype(fn()) {
  step_trace_scope trace_scope{ name, key };
  try {
    return fn();
  } catch (convergence_error const &) {
    throw;
  } catch (readiness_timeout const &e) {
    throw convergence_error(name, key, failure_kind::READINESS_TIMEOUT, e.what());
  } catch (creation_conflict const &e) {
    throw convergence_error(name, key, failure_kind::CONFLICT, e.what());
  } catch (remote_error const &e) {
    throw convergence_error(name, key, failure_kind::REMOTE, e.what());
  } catch (configuration_error const &e) {
    throw convergence_error(name, key, failure_kind::CONFIGURATION, e.what());
  } catch (std::exception const &e) {
    throw convergence_error(name, key, failure_kind::OTHER, e.what());
  }
}

// Environments and code packages for every function, before any control-plane call,
// so a bad configuration never leaves a half-converged topology behind.
std::vector<orchestrator::prepared_function> orchestrator::prepare() {
  step("validate_config", "config", [&] { deploy_config_validate(cfg_); });

  std::map<std::string, env_map> overrides;
  for (auto const &f : cfg_.functions) { overrides.emplace(f.name, f.env); }
  env_builder const environment{ cfg_.common_env, cfg_.variables(), std::move(overrides) };

  std::vector<prepared_function> out;
  for (auto const &f : cfg_.functions) {
    prepared_function p{ .cfg = &f };
    p.spec.name = f.name;
    p.spec.runtime = f.runtime;
    p.spec.role_arn = cfg_.role_arn;
    p.spec.handler = f.handler;
    p.spec.timeout_seconds = f.timeout_seconds;
    p.spec.environment = step("build_environment", f.name, [&] {
      return environment.build(f.name);
    });
    p.spec.code = step("package_code", f.name, [&] { return code_loader_(f); });
    out.push_back(std::move(p));
  }
  return out;
}

convergence_result orchestrator::run() {
  auto const functions{ prepare() };

  converger conv{ plane_, options_ };
  convergence_result result;

  step("ensure_bucket", cfg_.bucket, [&] { conv.ensure_bucket(cfg_.bucket); });
  step("ensure_table", cfg_.table.name, [&] { conv.ensure_table(cfg_.table); });

  result.api_id = step("ensure_api", cfg_.api.name, [&] { return conv.ensure_api(cfg_.api); });
  result.root_resource_id = step("await_api_ready", result.api_id, [&] {
    return conv.await_api_ready(result.api_id);
  });

  for (auto const &f : functions) {
    step("deploy_function", f.spec.name, [&] { conv.deploy_function(f.spec); });

    if (f.cfg->route) {
      auto const &route{ *f.cfg->route };
      result.routes[f.spec.name] =
          step("ensure_route", route.http_method + " /" + route.path, [&] {
            return conv.ensure_route(result.api_id, result.root_resource_id, route, f.spec.name);
          });
    }
  }

  result.queue = step("ensure_queue", cfg_.queue, [&] { return conv.ensure_queue(cfg_.queue); });

  auto const bucket_arn{ arn_bucket(cfg_.bucket) };
  step("ensure_queue_policy", cfg_.queue, [&] {
    conv.ensure_queue_policy(result.queue, bucket_arn);
  });
  step("ensure_bucket_notification", cfg_.bucket, [&] {
    conv.ensure_bucket_notification(cfg_.bucket, result.queue.arn);
  });
  result.event_source_mapping_uuid =
      step("ensure_event_source_mapping", cfg_.queue_consumer, [&] {
        return conv.ensure_event_source_mapping(event_source_mapping_spec{
            .function_name = cfg_.queue_consumer,
            .source_arn = result.queue.arn });
      });

  result.deployment = step("publish_deployment", result.api_id + "/" + cfg_.stage, [&] {
    return publish_deployment(plane_, result.api_id, cfg_.stage);
  });
  result.endpoint_url = endpoint_url(cfg_.endpoint, cfg_.region, result.api_id, cfg_.stage);
  result.summary = conv.summary();
  return result;
}

void orchestrator::update_code(std::string const &function_name) {
  auto const *f{ cfg_.find_function(function_name) };
  if (!f) {
    throw convergence_error("update_code",
                            function_name,
                            failure_kind::CONFIGURATION,
                            "function is not declared in the configuration");
  }

  auto const code{ step("package_code", function_name, [&] { return code_loader_(*f); }) };
  step("update_function_code", function_name, [&] {
    plane_.update_function_code(function_name, code);
  });
  tui::info("Updated code of %s (%zu bytes)", function_name.c_str(), code.size());
  STRATA_TRACE_RESOURCE_UPDATED(resource_kind::FUNCTION, function_name, "code");
}

}  // namespace strata
