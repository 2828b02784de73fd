#include "memory_control_plane.h"

#include "errors.h"
#include "policy_doc.h"

#include <algorithm>
#include <iterator>

namespace strata {

memory_control_plane::memory_control_plane(std::string region, std::string account_id)
    : region_{ std::move(region) }, account_id_{ std::move(account_id) } {}

void memory_control_plane::record(std::string const &operation) {
  calls_.push_back(operation);

  if (auto const it{ pending_failures_.find(operation) }; it != pending_failures_.end()) {
    bool const conflict{ it->second };
    pending_failures_.erase(it);
    if (conflict) {
      throw creation_conflict(operation, "ResourceConflictException", "injected conflict");
    }
    throw remote_error(operation, "InternalFailure", "injected failure");
  }
}

void memory_control_plane::record_creation(std::string const &operation) {
  record(operation);
  ++creation_calls_;
}

void memory_control_plane::record_mutation(std::string const &operation) {
  record(operation);
  ++mutation_calls_;
}

std::string memory_control_plane::next_id(std::string_view prefix) {
  return std::string(prefix) + "-" + std::to_string(next_id_++);
}

memory_control_plane::api_state &memory_control_plane::api_or_throw(
    std::string const &operation,
    std::string const &api_id) {
  auto const it{ std::find_if(apis_.begin(), apis_.end(), [&](auto const &a) {
    return a.summary.id == api_id;
  }) };
  if (it == apis_.end()) {
    throw remote_error(operation, "NotFoundException", "Invalid API identifier " + api_id);
  }
  return *it;
}

memory_control_plane::function_state &memory_control_plane::function_or_throw(
    std::string const &operation,
    std::string const &function_name) {
  auto const it{ functions_.find(function_name) };
  if (it == functions_.end()) {
    throw remote_error(operation,
                       "ResourceNotFoundException",
                       "Function not found: " + function_name);
  }
  return it->second;
}

memory_control_plane::queue_state *memory_control_plane::queue_by_url(
    std::string const &url) {
  for (auto &[name, q] : queues_) {
    if (q.identity.url == url) { return &q; }
  }
  return nullptr;
}

bool memory_control_plane::bucket_exists(std::string const &bucket) {
  record("bucket_exists");
  return buckets_.contains(bucket);
}

bool memory_control_plane::table_exists(std::string const &table) {
  record("table_exists");
  return tables_.contains(table);
}

std::vector<api_summary> memory_control_plane::list_apis() {
  record("list_apis");
  std::vector<api_summary> out;
  for (auto const &a : apis_) { out.push_back(a.summary); }
  return out;
}

std::vector<gateway_resource> memory_control_plane::get_resources(
    std::string const &api_id) {
  record("get_resources");
  ++resource_reads_;
  auto &api{ api_or_throw("get_resources", api_id) };

  if (unreadable_reads_ != 0) {
    if (unreadable_reads_ > 0) { --unreadable_reads_; }
    throw remote_error("get_resources", "NotFoundException", "API not yet available");
  }
  return api.resources;
}

bool memory_control_plane::method_exists(std::string const &api_id,
                                         std::string const &resource_id,
                                         std::string const &http_method) {
  record("method_exists");
  return api_or_throw("method_exists", api_id).methods.contains({ resource_id, http_method });
}

bool memory_control_plane::integration_exists(std::string const &api_id,
                                              std::string const &resource_id,
                                              std::string const &http_method) {
  record("integration_exists");
  return api_or_throw("integration_exists", api_id)
      .integrations.contains({ resource_id, http_method });
}

bool memory_control_plane::function_exists(std::string const &function_name) {
  record("function_exists");
  return functions_.contains(function_name);
}

std::optional<std::string> memory_control_plane::get_function_policy(
    std::string const &function_name) {
  record("get_function_policy");
  auto const it{ functions_.find(function_name) };
  if (it == functions_.end()) { return std::nullopt; }
  return it->second.policy;
}

std::optional<std::string> memory_control_plane::get_queue_url(
    std::string const &queue_name) {
  record("get_queue_url");
  auto const it{ queues_.find(queue_name) };
  if (it == queues_.end()) { return std::nullopt; }
  return it->second.identity.url;
}

std::string memory_control_plane::get_queue_arn(std::string const &queue_url) {
  record("get_queue_arn");
  if (auto const *q{ queue_by_url(queue_url) }) { return q->identity.arn; }
  throw remote_error("get_queue_arn",
                     "AWS.SimpleQueueService.NonExistentQueue",
                     "no queue at " + queue_url);
}

std::optional<std::string> memory_control_plane::get_queue_policy(
    std::string const &queue_url) {
  record("get_queue_policy");
  if (auto const *q{ queue_by_url(queue_url) }) { return q->policy; }
  throw remote_error("get_queue_policy",
                     "AWS.SimpleQueueService.NonExistentQueue",
                     "no queue at " + queue_url);
}

notification_config memory_control_plane::get_bucket_notification(
    std::string const &bucket) {
  record("get_bucket_notification");
  if (!buckets_.contains(bucket)) {
    throw remote_error("get_bucket_notification", "NoSuchBucket", bucket);
  }
  auto const it{ notifications_.find(bucket) };
  return it == notifications_.end() ? notification_config{} : it->second;
}

std::vector<event_source_mapping> memory_control_plane::list_event_source_mappings(
    std::string const &function_name,
    std::string const &source_arn) {
  record("list_event_source_mappings");
  std::vector<event_source_mapping> out;
  std::copy_if(mappings_.begin(),
               mappings_.end(),
               std::back_inserter(out),
               [&](auto const &m) {
                 return m.function_name == function_name && m.source_arn == source_arn;
               });
  return out;
}

void memory_control_plane::create_bucket(std::string const &bucket) {
  record_creation("create_bucket");
  if (!buckets_.insert(bucket).second) {
    throw creation_conflict("create_bucket", "BucketAlreadyOwnedByYou", bucket);
  }
}

void memory_control_plane::create_table(table_spec const &spec) {
  record_creation("create_table");
  if (!tables_.emplace(spec.name, spec).second) {
    throw creation_conflict("create_table", "ResourceInUseException", spec.name);
  }
}

std::string memory_control_plane::create_api(api_spec const &spec) {
  record_creation("create_api");
  return seed_api(spec.name, clock_ms_++);
}

std::string memory_control_plane::create_resource(std::string const &api_id,
                                                  std::string const &parent_id,
                                                  std::string const &path_part) {
  record_creation("create_resource");
  auto &api{ api_or_throw("create_resource", api_id) };

  auto const parent{ std::find_if(api.resources.begin(),
                                  api.resources.end(),
                                  [&](auto const &r) { return r.id == parent_id; }) };
  if (parent == api.resources.end()) {
    throw remote_error("create_resource", "NotFoundException", "Invalid parent id");
  }

  std::string const path{ (parent->path == "/" ? "" : parent->path) + "/" + path_part };
  for (auto const &r : api.resources) {
    if (r.path == path) {
      throw creation_conflict("create_resource", "ConflictException", path);
    }
  }

  auto id{ next_id("res") };
  api.resources.push_back({ id, path, parent_id });
  return id;
}

void memory_control_plane::put_method(method_spec const &spec) {
  record_creation("put_method");
  auto &api{ api_or_throw("put_method", spec.api_id) };
  if (!api.methods.insert({ spec.resource_id, spec.http_method }).second) {
    throw creation_conflict("put_method", "ConflictException", "Method already exists");
  }
}

void memory_control_plane::put_integration(integration_spec const &spec) {
  record_creation("put_integration");
  auto &api{ api_or_throw("put_integration", spec.api_id) };
  if (!api.methods.contains({ spec.resource_id, spec.http_method })) {
    throw remote_error("put_integration", "NotFoundException", "Invalid Method identifier");
  }
  api.integrations[{ spec.resource_id, spec.http_method }] = spec;
}

std::string memory_control_plane::create_deployment(std::string const &api_id,
                                                    std::string const &stage) {
  record_mutation("create_deployment");
  api_or_throw("create_deployment", api_id);
  deployments_.push_back({ api_id, stage, next_id("dep") });
  return deployments_.back().id;
}

void memory_control_plane::create_function(function_spec const &spec) {
  record_creation("create_function");
  if (functions_.contains(spec.name)) {
    throw creation_conflict("create_function",
                            "ResourceConflictException",
                            "Function already exist: " + spec.name);
  }
  functions_[spec.name].spec = spec;
}

void memory_control_plane::update_function_code(std::string const &function_name,
                                                std::vector<unsigned char> const &zip) {
  record_mutation("update_function_code");
  auto &f{ function_or_throw("update_function_code", function_name) };
  f.spec.code = zip;
  ++f.code_uploads;
}

void memory_control_plane::update_function_configuration(function_spec const &spec) {
  record_mutation("update_function_configuration");
  auto &f{ function_or_throw("update_function_configuration", spec.name) };
  auto code{ std::move(f.spec.code) };
  f.spec = spec;
  f.spec.code = std::move(code);
  ++f.configuration_updates;
}

void memory_control_plane::add_permission(permission_grant const &grant) {
  record_creation("add_permission");
  auto &f{ function_or_throw("add_permission", grant.function_name) };
  if (f.policy && policy_has_statement(*f.policy, grant.statement_id)) {
    throw creation_conflict("add_permission",
                            "ResourceConflictException",
                            "The statement id (" + grant.statement_id +
                                ") provided already exists");
  }
  f.policy = policy_add_statement(f.policy, grant);
}

std::string memory_control_plane::create_queue(std::string const &queue_name) {
  record_creation("create_queue");
  if (auto const it{ queues_.find(queue_name) }; it != queues_.end()) {
    return it->second.identity.url;
  }
  auto &q{ queues_[queue_name] };
  q.identity = { queue_name,
                 "http://localhost:4566/" + account_id_ + "/" + queue_name,
                 "arn:aws:sqs:" + region_ + ":" + account_id_ + ":" + queue_name };
  return q.identity.url;
}

void memory_control_plane::set_queue_policy(std::string const &queue_url,
                                            std::string const &policy) {
  record_mutation("set_queue_policy");
  auto *q{ queue_by_url(queue_url) };
  if (!q) {
    throw remote_error("set_queue_policy",
                       "AWS.SimpleQueueService.NonExistentQueue",
                       "no queue at " + queue_url);
  }
  q->policy = policy;
}

void memory_control_plane::put_bucket_notification(std::string const &bucket,
                                                   notification_config const &config) {
  record_mutation("put_bucket_notification");
  if (!buckets_.contains(bucket)) {
    throw remote_error("put_bucket_notification", "NoSuchBucket", bucket);
  }
  notifications_[bucket] = config;
}

std::string memory_control_plane::create_event_source_mapping(
    event_source_mapping_spec const &spec) {
  record_creation("create_event_source_mapping");
  function_or_throw("create_event_source_mapping", spec.function_name);
  for (auto const &m : mappings_) {
    if (m.function_name == spec.function_name && m.source_arn == spec.source_arn) {
      throw creation_conflict("create_event_source_mapping",
                              "ResourceConflictException",
                              "mapping exists: " + m.uuid);
    }
  }
  mappings_.push_back({ next_id("esm"), spec.function_name, spec.source_arn });
  return mappings_.back().uuid;
}

std::string memory_control_plane::seed_api(std::string const &name,
                                           std::int64_t created_epoch_ms) {
  api_state api;
  api.summary = { next_id("api"), name, created_epoch_ms };
  api.resources.push_back({ next_id("root"), "/", std::nullopt });
  apis_.push_back(std::move(api));
  return apis_.back().summary.id;
}

std::string memory_control_plane::seed_resource(std::string const &api_id,
                                                std::string const &path_part) {
  auto &api{ api_or_throw("seed_resource", api_id) };
  auto id{ next_id("res") };
  api.resources.push_back({ id, "/" + path_part, api.resources.front().id });
  return id;
}

void memory_control_plane::seed_method(std::string const &api_id,
                                       std::string const &resource_id,
                                       std::string const &http_method) {
  api_or_throw("seed_method", api_id).methods.insert({ resource_id, http_method });
}

void memory_control_plane::seed_bucket(std::string const &bucket) { buckets_.insert(bucket); }

void memory_control_plane::seed_notification(std::string const &bucket,
                                             notification_config config) {
  buckets_.insert(bucket);
  notifications_[bucket] = std::move(config);
}

void memory_control_plane::seed_function_policy(std::string const &function_name,
                                                std::string policy) {
  functions_[function_name].policy = std::move(policy);
  functions_[function_name].spec.name = function_name;
}

void memory_control_plane::seed_queue_policy(std::string const &queue_name,
                                             std::string policy) {
  auto &q{ queues_[queue_name] };
  q.identity = { queue_name,
                 "http://localhost:4566/" + account_id_ + "/" + queue_name,
                 "arn:aws:sqs:" + region_ + ":" + account_id_ + ":" + queue_name };
  q.policy = std::move(policy);
}

void memory_control_plane::set_unreadable_resource_reads(int reads) {
  unreadable_reads_ = reads;
}

void memory_control_plane::fail_next(std::string const &operation, bool conflict) {
  pending_failures_[operation] = conflict;
}

memory_control_plane::api_state const *memory_control_plane::find_api(
    std::string const &api_id) const {
  for (auto const &a : apis_) {
    if (a.summary.id == api_id) { return &a; }
  }
  return nullptr;
}

memory_control_plane::function_state const *memory_control_plane::find_function(
    std::string const &function_name) const {
  auto const it{ functions_.find(function_name) };
  return it == functions_.end() ? nullptr : &it->second;
}

memory_control_plane::queue_state const *memory_control_plane::find_queue(
    std::string const &queue_name) const {
  auto const it{ queues_.find(queue_name) };
  return it == queues_.end() ? nullptr : &it->second;
}

notification_config const &memory_control_plane::notification(
    std::string const &bucket) const {
  static notification_config const empty;
  auto const it{ notifications_.find(bucket) };
  return it == notifications_.end() ? empty : it->second;
}

}  // namespace strata
