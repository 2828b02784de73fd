#pragma once

#include "control_plane.h"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace strata {

// In-process control plane. Mirrors the service behaviors convergence depends on
// (duplicate API names allowed, whole-document notification replacement, duplicate
// statement ids rejected) and records every call for assertions.
class memory_control_plane : public control_plane {
 public:
  struct api_state {
    api_summary summary;
    std::vector<gateway_resource> resources;
    std::set<std::tuple<std::string, std::string>> methods;  // (resource id, method)
    std::map<std::tuple<std::string, std::string>, integration_spec> integrations;
  };

  struct function_state {
    function_spec spec;
    std::optional<std::string> policy;
    int code_uploads{ 0 };
    int configuration_updates{ 0 };
  };

  struct queue_state {
    queue_identity identity;
    std::optional<std::string> policy;
  };

  explicit memory_control_plane(std::string region = "us-east-1",
                                std::string account_id = "000000000000");

  // resource_probe
  bool bucket_exists(std::string const &bucket) override;
  bool table_exists(std::string const &table) override;
  std::vector<api_summary> list_apis() override;
  std::vector<gateway_resource> get_resources(std::string const &api_id) override;
  bool method_exists(std::string const &api_id,
                     std::string const &resource_id,
                     std::string const &http_method) override;
  bool integration_exists(std::string const &api_id,
                          std::string const &resource_id,
                          std::string const &http_method) override;
  bool function_exists(std::string const &function_name) override;
  std::optional<std::string> get_function_policy(std::string const &function_name) override;
  std::optional<std::string> get_queue_url(std::string const &queue_name) override;
  std::string get_queue_arn(std::string const &queue_url) override;
  std::optional<std::string> get_queue_policy(std::string const &queue_url) override;
  notification_config get_bucket_notification(std::string const &bucket) override;
  std::vector<event_source_mapping> list_event_source_mappings(
      std::string const &function_name,
      std::string const &source_arn) override;

  // resource_creator
  void create_bucket(std::string const &bucket) override;
  void create_table(table_spec const &spec) override;
  std::string create_api(api_spec const &spec) override;
  std::string create_resource(std::string const &api_id,
                              std::string const &parent_id,
                              std::string const &path_part) override;
  void put_method(method_spec const &spec) override;
  void put_integration(integration_spec const &spec) override;
  std::string create_deployment(std::string const &api_id,
                                std::string const &stage) override;
  void create_function(function_spec const &spec) override;
  void update_function_code(std::string const &function_name,
                            std::vector<unsigned char> const &zip) override;
  void update_function_configuration(function_spec const &spec) override;
  void add_permission(permission_grant const &grant) override;
  std::string create_queue(std::string const &queue_name) override;
  void set_queue_policy(std::string const &queue_url, std::string const &policy) override;
  void put_bucket_notification(std::string const &bucket,
                               notification_config const &config) override;
  std::string create_event_source_mapping(event_source_mapping_spec const &spec) override;

  // Seeding pre-existing state.
  std::string seed_api(std::string const &name, std::int64_t created_epoch_ms);
  std::string seed_resource(std::string const &api_id, std::string const &path_part);
  void seed_method(std::string const &api_id,
                   std::string const &resource_id,
                   std::string const &http_method);
  void seed_bucket(std::string const &bucket);
  void seed_notification(std::string const &bucket, notification_config config);
  void seed_function_policy(std::string const &function_name, std::string policy);
  void seed_queue_policy(std::string const &queue_name, std::string policy);

  // Failure injection.
  // The next `reads` resource-tree reads fail; a negative count never recovers.
  void set_unreadable_resource_reads(int reads);
  // The next call to `operation` (e.g. "create_queue") throws remote_error, or
  // creation_conflict when `conflict` is set.
  void fail_next(std::string const &operation, bool conflict = false);

  // Inspection.
  int creation_calls() const { return creation_calls_; }
  int mutation_calls() const { return mutation_calls_; }
  int resource_reads() const { return resource_reads_; }
  std::vector<std::string> const &calls() const { return calls_; }

  std::vector<api_state> const &apis() const { return apis_; }
  api_state const *find_api(std::string const &api_id) const;
  function_state const *find_function(std::string const &function_name) const;
  queue_state const *find_queue(std::string const &queue_name) const;
  notification_config const &notification(std::string const &bucket) const;
  std::vector<event_source_mapping> const &event_source_mappings() const {
    return mappings_;
  }
  std::vector<deployment_record> const &deployments() const { return deployments_; }
  std::set<std::string> const &buckets() const { return buckets_; }
  std::map<std::string, table_spec> const &tables() const { return tables_; }

 private:
  void record(std::string const &operation);
  void record_creation(std::string const &operation);
  void record_mutation(std::string const &operation);
  std::string next_id(std::string_view prefix);

  api_state &api_or_throw(std::string const &operation, std::string const &api_id);
  function_state &function_or_throw(std::string const &operation,
                                    std::string const &function_name);
  queue_state *queue_by_url(std::string const &url);

  std::string region_;
  std::string account_id_;

  std::set<std::string> buckets_;
  std::map<std::string, table_spec> tables_;
  std::vector<api_state> apis_;
  std::map<std::string, function_state> functions_;
  std::map<std::string, queue_state> queues_;
  std::map<std::string, notification_config> notifications_;
  std::vector<event_source_mapping> mappings_;
  std::vector<deployment_record> deployments_;

  int unreadable_reads_{ 0 };
  std::map<std::string, bool> pending_failures_;  // operation -> conflict

  int next_id_{ 1 };
  std::int64_t clock_ms_{ 1700000000000 };
  int creation_calls_{ 0 };
  int mutation_calls_{ 0 };
  int resource_reads_{ 0 };
  std::vector<std::string> calls_;
};

}  // namespace strata
