#pragma once

#include "resource.h"
#include "util.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

// True when a probe returned a usable identity. An unset optional, an empty or
// whitespace-only string, and the CLI-style sentinels "None" and "null" all mean
// "absent".
bool identity_present(std::optional<std::string> const &identity);

// Read-only queries. Never create or mutate. "Not found" is reported as absence
// (false, nullopt, empty list); every other failure throws remote_error.
class resource_probe : unmovable {
 public:
  virtual ~resource_probe() = default;

  virtual bool bucket_exists(std::string const &bucket) = 0;
  virtual bool table_exists(std::string const &table) = 0;

  virtual std::vector<api_summary> list_apis() = 0;
  // Throws remote_error while the API's resource tree is not yet readable.
  virtual std::vector<gateway_resource> get_resources(std::string const &api_id) = 0;
  virtual bool method_exists(std::string const &api_id,
                             std::string const &resource_id,
                             std::string const &http_method) = 0;
  virtual bool integration_exists(std::string const &api_id,
                                  std::string const &resource_id,
                                  std::string const &http_method) = 0;

  virtual bool function_exists(std::string const &function_name) = 0;
  // Raw policy document, nullopt when the function has no resource policy.
  virtual std::optional<std::string> get_function_policy(
      std::string const &function_name) = 0;

  virtual std::optional<std::string> get_queue_url(std::string const &queue_name) = 0;
  virtual std::string get_queue_arn(std::string const &queue_url) = 0;
  virtual std::optional<std::string> get_queue_policy(std::string const &queue_url) = 0;

  virtual notification_config get_bucket_notification(std::string const &bucket) = 0;

  virtual std::vector<event_source_mapping> list_event_source_mappings(
      std::string const &function_name,
      std::string const &source_arn) = 0;
};

// Mutations. Callers probe first; a resource that appeared in between is reported
// as creation_conflict, any other failure as remote_error.
class resource_creator : unmovable {
 public:
  virtual ~resource_creator() = default;

  virtual void create_bucket(std::string const &bucket) = 0;
  virtual void create_table(table_spec const &spec) = 0;

  virtual std::string create_api(api_spec const &spec) = 0;
  virtual std::string create_resource(std::string const &api_id,
                                      std::string const &parent_id,
                                      std::string const &path_part) = 0;
  virtual void put_method(method_spec const &spec) = 0;
  virtual void put_integration(integration_spec const &spec) = 0;
  virtual std::string create_deployment(std::string const &api_id,
                                        std::string const &stage) = 0;

  virtual void create_function(function_spec const &spec) = 0;
  virtual void update_function_code(std::string const &function_name,
                                    std::vector<unsigned char> const &zip) = 0;
  virtual void update_function_configuration(function_spec const &spec) = 0;
  virtual void add_permission(permission_grant const &grant) = 0;

  virtual std::string create_queue(std::string const &queue_name) = 0;
  virtual void set_queue_policy(std::string const &queue_url,
                                std::string const &policy) = 0;

  // Replaces the bucket's whole notification configuration.
  virtual void put_bucket_notification(std::string const &bucket,
                                       notification_config const &config) = 0;

  virtual std::string create_event_source_mapping(
      event_source_mapping_spec const &spec) = 0;
};

// A control plane answers both sides.
class control_plane : public resource_probe, public resource_creator {};

}  // namespace strata
