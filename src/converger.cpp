#include "converger.h"

#include "arn.h"
#include "errors.h"
#include "policy_doc.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <thread>

namespace strata {

namespace {

constexpr char const *kObjectCreatedEvent{ "s3:ObjectCreated:*" };

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

std::string resource_path(std::string const &path_part) { return "/" + path_part; }

std::string method_key(std::string const &resource_id, std::string const &http_method) {
  return http_method + " " + resource_id;
}

std::optional<gateway_resource> find_by_path(std::vector<gateway_resource> const &resources,
                                             std::string const &path) {
  for (auto const &r : resources) {
    if (r.path == path && identity_present(r.id)) { return r; }
  }
  return std::nullopt;
}

}  // namespace

converger::converger(control_plane &plane, converge_options options)
    : plane_{ plane }, options_{ std::move(options) } {
  if (!options_.sleep) {
    options_.sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

void converger::note_adopted(resource_kind kind,
                             std::string const &key,
                             std::string const &identity) {
  ++summary_.adopted;
  tui::info("%s %s exists (%s)",
            std::string(resource_kind_name(kind)).c_str(),
            key.c_str(),
            identity.c_str());
  STRATA_TRACE_RESOURCE_ADOPTED(kind, key, identity);
}

void converger::note_created(resource_kind kind,
                             std::string const &key,
                             std::string const &identity,
                             std::chrono::steady_clock::time_point start) {
  ++summary_.created;
  tui::info("Created %s %s (%s)",
            std::string(resource_kind_name(kind)).c_str(),
            key.c_str(),
            identity.c_str());
  STRATA_TRACE_RESOURCE_CREATED(kind, key, identity, elapsed_ms(start));
}

void converger::note_updated(resource_kind kind,
                             std::string const &key,
                             std::string const &aspect) {
  ++summary_.updated;
  tui::info("Updated %s %s (%s)",
            std::string(resource_kind_name(kind)).c_str(),
            key.c_str(),
            aspect.c_str());
  STRATA_TRACE_RESOURCE_UPDATED(kind, key, aspect);
}

void converger::note_skipped(resource_kind kind,
                             std::string const &key,
                             std::string const &reason) {
  ++summary_.skipped;
  tui::debug("Skipping %s %s: %s",
             std::string(resource_kind_name(kind)).c_str(),
             key.c_str(),
             reason.c_str());
  STRATA_TRACE_RESOURCE_SKIPPED(kind, key, reason);
}

void converger::ensure_bucket(std::string const &bucket) {
  bool const present{ plane_.bucket_exists(bucket) };
  STRATA_TRACE_PROBE_RESULT(resource_kind::BUCKET, bucket, present, present ? bucket : "");
  if (present) {
    note_adopted(resource_kind::BUCKET, bucket, arn_bucket(bucket));
    return;
  }

  auto const start{ std::chrono::steady_clock::now() };
  try {
    plane_.create_bucket(bucket);
  } catch (creation_conflict const &e) {
    STRATA_TRACE_CONFLICT_RECOVERED(resource_kind::BUCKET, bucket, e.what());
    note_adopted(resource_kind::BUCKET, bucket, arn_bucket(bucket));
    return;
  }
  note_created(resource_kind::BUCKET, bucket, arn_bucket(bucket), start);
}

void converger::ensure_table(table_spec const &spec) {
  bool const present{ plane_.table_exists(spec.name) };
  STRATA_TRACE_PROBE_RESULT(resource_kind::TABLE, spec.name, present, present ? spec.name : "");
  if (present) {
    // Schema is never altered once the table exists.
    note_adopted(resource_kind::TABLE, spec.name, spec.name);
    return;
  }

  auto const start{ std::chrono::steady_clock::now() };
  try {
    plane_.create_table(spec);
  } catch (creation_conflict const &e) {
    STRATA_TRACE_CONFLICT_RECOVERED(resource_kind::TABLE, spec.name, e.what());
    note_adopted(resource_kind::TABLE, spec.name, spec.name);
    return;
  }
  note_created(resource_kind::TABLE, spec.name, spec.name, start);
}

std::string converger::ensure_api(api_spec const &spec) {
  std::vector<api_summary> matches;
  for (auto &api : plane_.list_apis()) {
    if (api.name == spec.name && identity_present(api.id)) {
      matches.push_back(std::move(api));
    }
  }

  if (!matches.empty()) {
    std::sort(matches.begin(), matches.end(), [](auto const &a, auto const &b) {
      if (a.created_epoch_ms != b.created_epoch_ms) {
        return a.created_epoch_ms < b.created_epoch_ms;
      }
      return a.id < b.id;
    });

    if (matches.size() > 1) {
      std::vector<std::string> ignored;
      for (auto it{ matches.begin() + 1 }; it != matches.end(); ++it) {
        ignored.push_back(it->id);
      }
      tui::warn("%zu APIs named '%s'; using earliest created %s, ignoring %s",
                matches.size(),
                spec.name.c_str(),
                matches.front().id.c_str(),
                util_join(ignored, ", ").c_str());
    }

    STRATA_TRACE_PROBE_RESULT(resource_kind::API, spec.name, true, matches.front().id);
    note_adopted(resource_kind::API, spec.name, matches.front().id);
    return matches.front().id;
  }

  STRATA_TRACE_PROBE_RESULT(resource_kind::API, spec.name, false, "");
  auto const start{ std::chrono::steady_clock::now() };
  auto const id{ plane_.create_api(spec) };
  if (!identity_present(id)) {
    throw remote_error("create_api", "EmptyIdentity", "no id returned for " + spec.name);
  }
  note_created(resource_kind::API, spec.name, id, start);
  return id;
}

std::string converger::await_api_ready(std::string const &api_id) {
  int const attempts{ std::max(1, options_.readiness_attempts) };

  for (int attempt{ 1 }; attempt <= attempts; ++attempt) {
    std::optional<std::vector<gateway_resource>> resources;
    try {
      resources = plane_.get_resources(api_id);
    } catch (remote_error const &e) {
      STRATA_TRACE_READINESS_ATTEMPT(api_id, attempt, attempts, false);
      tui::debug("API %s not ready (attempt %d/%d): %s",
                 api_id.c_str(),
                 attempt,
                 attempts,
                 e.what());
    }

    if (resources) {
      STRATA_TRACE_READINESS_ATTEMPT(api_id, attempt, attempts, true);
      auto const root{ find_by_path(*resources, "/") };
      if (!root) {
        throw remote_error("get_resources",
                           "MissingRoot",
                           "API " + api_id + " has no root resource");
      }
      return root->id;
    }

    if (attempt < attempts) { options_.sleep(options_.readiness_backoff); }
  }

  throw readiness_timeout(api_id, attempts);
}

std::string converger::ensure_gateway_resource(std::string const &api_id,
                                               std::string const &parent_id,
                                               std::string const &path_part) {
  auto const path{ resource_path(path_part) };

  if (auto const existing{ find_by_path(plane_.get_resources(api_id), path) }) {
    STRATA_TRACE_PROBE_RESULT(resource_kind::GATEWAY_RESOURCE, path, true, existing->id);
    note_adopted(resource_kind::GATEWAY_RESOURCE, path, existing->id);
    return existing->id;
  }
  STRATA_TRACE_PROBE_RESULT(resource_kind::GATEWAY_RESOURCE, path, false, "");

  auto const start{ std::chrono::steady_clock::now() };
  try {
    auto const id{ plane_.create_resource(api_id, parent_id, path_part) };
    note_created(resource_kind::GATEWAY_RESOURCE, path, id, start);
    return id;
  } catch (creation_conflict const &e) {
    auto const raced{ find_by_path(plane_.get_resources(api_id), path) };
    if (!raced) { throw; }
    STRATA_TRACE_CONFLICT_RECOVERED(resource_kind::GATEWAY_RESOURCE, path, e.what());
    note_adopted(resource_kind::GATEWAY_RESOURCE, path, raced->id);
    return raced->id;
  }
}

void converger::ensure_method(method_spec const &spec) {
  auto const key{ method_key(spec.resource_id, spec.http_method) };
  bool const present{ plane_.method_exists(spec.api_id, spec.resource_id, spec.http_method) };
  STRATA_TRACE_PROBE_RESULT(resource_kind::METHOD, key, present, "");
  if (present) {
    note_skipped(resource_kind::METHOD, key, "method exists");
    return;
  }

  auto const start{ std::chrono::steady_clock::now() };
  try {
    plane_.put_method(spec);
  } catch (creation_conflict const &e) {
    STRATA_TRACE_CONFLICT_RECOVERED(resource_kind::METHOD, key, e.what());
    note_skipped(resource_kind::METHOD, key, "method appeared concurrently");
    return;
  }
  note_created(resource_kind::METHOD, key, spec.authorization, start);
}

void converger::ensure_integration(integration_spec const &spec) {
  auto const key{ method_key(spec.resource_id, spec.http_method) };
  bool const present{
    plane_.integration_exists(spec.api_id, spec.resource_id, spec.http_method)
  };
  STRATA_TRACE_PROBE_RESULT(resource_kind::INTEGRATION, key, present, "");
  if (present) {
    note_skipped(resource_kind::INTEGRATION, key, "integration exists");
    return;
  }

  auto const start{ std::chrono::steady_clock::now() };
  plane_.put_integration(spec);
  note_created(resource_kind::INTEGRATION, key, spec.uri, start);
}

void converger::ensure_permission(permission_grant const &grant) {
  auto const policy{ plane_.get_function_policy(grant.function_name) };
  bool const granted{ identity_present(policy) &&
                      policy_has_statement(*policy, grant.statement_id) };
  STRATA_TRACE_PROBE_RESULT(resource_kind::PERMISSION, grant.statement_id, granted, "");
  if (granted) {
    note_skipped(resource_kind::PERMISSION, grant.statement_id, "statement present");
    return;
  }

  auto const start{ std::chrono::steady_clock::now() };
  try {
    plane_.add_permission(grant);
  } catch (creation_conflict const &e) {
    tui::debug("Permission %s already granted: %s", grant.statement_id.c_str(), e.what());
    STRATA_TRACE_CONFLICT_RECOVERED(resource_kind::PERMISSION, grant.statement_id, e.what());
    note_skipped(resource_kind::PERMISSION, grant.statement_id, "statement already exists");
    return;
  }
  note_created(resource_kind::PERMISSION, grant.statement_id, grant.source_arn, start);
}

route_binding converger::ensure_route(std::string const &api_id,
                                      std::string const &root_id,
                                      route_cfg const &route,
                                      std::string const &function_name) {
  auto const resource_id{ ensure_gateway_resource(api_id, root_id, route.path) };

  ensure_method(method_spec{ .api_id = api_id,
                             .resource_id = resource_id,
                             .http_method = route.http_method });

  ensure_integration(integration_spec{
      .api_id = api_id,
      .resource_id = resource_id,
      .http_method = route.http_method,
      .uri = arn_lambda_integration_uri(options_.region, options_.account_id, function_name) });

  auto statement_id{ permission_statement_id(api_id, resource_id, route.http_method) };
  ensure_permission(permission_grant{
      .function_name = function_name,
      .statement_id = statement_id,
      .source_arn = arn_execute_api_source(options_.region,
                                           options_.account_id,
                                           api_id,
                                           route.http_method,
                                           route.path) });

  return { resource_id, std::move(statement_id) };
}

void converger::deploy_function(function_spec const &spec) {
  bool const present{ plane_.function_exists(spec.name) };
  STRATA_TRACE_PROBE_RESULT(resource_kind::FUNCTION, spec.name, present, "");

  if (!present) {
    auto const start{ std::chrono::steady_clock::now() };
    try {
      plane_.create_function(spec);
      note_created(resource_kind::FUNCTION,
                   spec.name,
                   arn_function(options_.region, options_.account_id, spec.name),
                   start);
      return;
    } catch (creation_conflict const &e) {
      STRATA_TRACE_CONFLICT_RECOVERED(resource_kind::FUNCTION, spec.name, e.what());
    }
  }

  // Code is not diffed; every run re-uploads it and reapplies configuration.
  plane_.update_function_code(spec.name, spec.code);
  note_updated(resource_kind::FUNCTION, spec.name, "code");
  plane_.update_function_configuration(spec);
  note_updated(resource_kind::FUNCTION, spec.name, "configuration");
}

queue_identity converger::ensure_queue(std::string const &queue_name) {
  queue_identity queue{ .name = queue_name };

  auto url{ plane_.get_queue_url(queue_name) };
  bool const present{ identity_present(url) };
  STRATA_TRACE_PROBE_RESULT(resource_kind::QUEUE, queue_name, present, present ? *url : "");

  if (present) {
    queue.url = std::move(*url);
    queue.arn = plane_.get_queue_arn(queue.url);
    note_adopted(resource_kind::QUEUE, queue_name, queue.arn);
    return queue;
  }

  auto const start{ std::chrono::steady_clock::now() };
  try {
    queue.url = plane_.create_queue(queue_name);
  } catch (creation_conflict const &e) {
    auto raced{ plane_.get_queue_url(queue_name) };
    if (!identity_present(raced)) { throw; }
    STRATA_TRACE_CONFLICT_RECOVERED(resource_kind::QUEUE, queue_name, e.what());
    queue.url = std::move(*raced);
    queue.arn = plane_.get_queue_arn(queue.url);
    note_adopted(resource_kind::QUEUE, queue_name, queue.arn);
    return queue;
  }

  if (!identity_present(queue.url)) {
    throw remote_error("create_queue", "EmptyIdentity", "no URL returned for " + queue_name);
  }
  queue.arn = plane_.get_queue_arn(queue.url);
  note_created(resource_kind::QUEUE, queue_name, queue.arn, start);
  return queue;
}

void converger::ensure_queue_policy(queue_identity const &queue,
                                    std::string const &source_arn) {
  auto const policy{ plane_.get_queue_policy(queue.url) };
  bool const allowed{ identity_present(policy) &&
                      policy_allows_source(*policy, queue.arn, source_arn) };
  STRATA_TRACE_PROBE_RESULT(resource_kind::QUEUE_POLICY, queue.name, allowed, "");
  if (allowed) {
    note_skipped(resource_kind::QUEUE_POLICY, queue.name, "source already allowed");
    return;
  }

  plane_.set_queue_policy(queue.url, queue_policy_document(queue.arn, source_arn));
  note_updated(resource_kind::QUEUE_POLICY, queue.name, "allow " + source_arn);
}

void converger::ensure_bucket_notification(std::string const &bucket,
                                           std::string const &queue_arn) {
  auto const existing{ plane_.get_bucket_notification(bucket) };
  bool const targeted{ notification_targets_queue(existing, queue_arn) };
  STRATA_TRACE_PROBE_RESULT(resource_kind::NOTIFICATION, bucket, targeted, "");
  if (targeted) {
    note_skipped(resource_kind::NOTIFICATION, bucket, "queue already targeted");
    return;
  }

  std::vector<std::string> replaced;
  for (auto const &t : existing.queue_configurations) { replaced.push_back(t.queue_arn); }
  replaced.insert(replaced.end(),
                  existing.other_targets.begin(),
                  existing.other_targets.end());
  if (!replaced.empty()) {
    tui::warn("Replacing notification configuration of bucket %s; dropping targets: %s",
              bucket.c_str(),
              util_join(replaced, ", ").c_str());
  }

  notification_config config;
  config.queue_configurations.push_back(
      notification_target{ .queue_arn = queue_arn, .events = { kObjectCreatedEvent } });
  plane_.put_bucket_notification(bucket, config);
  note_updated(resource_kind::NOTIFICATION, bucket, "queue " + queue_arn);
}

std::string converger::ensure_event_source_mapping(event_source_mapping_spec const &spec) {
  auto const key{ spec.function_name + " <- " + spec.source_arn };

  auto const find_existing{ [&]() -> std::optional<std::string> {
    for (auto const &m : plane_.list_event_source_mappings(spec.function_name,
                                                           spec.source_arn)) {
      if (m.source_arn == spec.source_arn && identity_present(m.uuid)) { return m.uuid; }
    }
    return std::nullopt;
  } };

  if (auto const uuid{ find_existing() }) {
    STRATA_TRACE_PROBE_RESULT(resource_kind::EVENT_SOURCE_MAPPING, key, true, *uuid);
    note_adopted(resource_kind::EVENT_SOURCE_MAPPING, key, *uuid);
    return *uuid;
  }
  STRATA_TRACE_PROBE_RESULT(resource_kind::EVENT_SOURCE_MAPPING, key, false, "");

  auto const start{ std::chrono::steady_clock::now() };
  try {
    auto uuid{ plane_.create_event_source_mapping(spec) };
    note_created(resource_kind::EVENT_SOURCE_MAPPING, key, uuid, start);
    return uuid;
  } catch (creation_conflict const &e) {
    auto const raced{ find_existing() };
    if (!raced) { throw; }
    STRATA_TRACE_CONFLICT_RECOVERED(resource_kind::EVENT_SOURCE_MAPPING, key, e.what());
    note_adopted(resource_kind::EVENT_SOURCE_MAPPING, key, *raced);
    return *raced;
  }
}

}  // namespace strata
