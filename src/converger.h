#pragma once

#include "control_plane.h"
#include "deploy_config.h"
#include "resource.h"
#include "util.h"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace strata {

struct converge_options {
  std::string region{ "us-east-1" };
  std::string account_id{ "000000000000" };

  int readiness_attempts{ 5 };
  std::chrono::milliseconds readiness_backoff{ 2000 };
  // Defaults to std::this_thread::sleep_for; tests substitute a no-op.
  std::function<void(std::chrono::milliseconds)> sleep;
};

struct run_summary {
  int created{ 0 };
  int adopted{ 0 };
  int updated{ 0 };
  int skipped{ 0 };
};

struct route_binding {
  std::string resource_id;
  std::string statement_id;
};

// Query-then-act convergence of each node in the topology. Every ensure_* probes
// first, adopts what exists, creates what is missing and returns the identity
// downstream steps need. Failures other than recognized "already exists" races
// propagate.
class converger : unmovable {
 public:
  converger(control_plane &plane, converge_options options);

  void ensure_bucket(std::string const &bucket);
  void ensure_table(table_spec const &spec);

  // API id. Among several APIs sharing the name, the earliest created wins (ties by
  // smallest id).
  std::string ensure_api(api_spec const &spec);

  // Root resource id once the resource tree is readable. Throws readiness_timeout.
  std::string await_api_ready(std::string const &api_id);

  std::string ensure_gateway_resource(std::string const &api_id,
                                      std::string const &parent_id,
                                      std::string const &path_part);
  void ensure_method(method_spec const &spec);
  void ensure_integration(integration_spec const &spec);
  void ensure_permission(permission_grant const &grant);

  // resource -> method -> integration -> invoke permission for one function.
  route_binding ensure_route(std::string const &api_id,
                             std::string const &root_id,
                             route_cfg const &route,
                             std::string const &function_name);

  // Creates the function, or re-uploads code and reapplies configuration.
  void deploy_function(function_spec const &spec);

  queue_identity ensure_queue(std::string const &queue_name);
  void ensure_queue_policy(queue_identity const &queue, std::string const &source_arn);
  void ensure_bucket_notification(std::string const &bucket, std::string const &queue_arn);
  std::string ensure_event_source_mapping(event_source_mapping_spec const &spec);

  run_summary const &summary() const { return summary_; }

 private:
  void note_adopted(resource_kind kind, std::string const &key, std::string const &identity);
  void note_created(resource_kind kind,
                    std::string const &key,
                    std::string const &identity,
                    std::chrono::steady_clock::time_point start);
  void note_updated(resource_kind kind, std::string const &key, std::string const &aspect);
  void note_skipped(resource_kind kind, std::string const &key, std::string const &reason);

  control_plane &plane_;
  converge_options options_;
  run_summary summary_;
};

}  // namespace strata
