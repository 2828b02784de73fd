#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class resource_kind {
  BUCKET,
  TABLE,
  API,
  GATEWAY_RESOURCE,
  METHOD,
  INTEGRATION,
  PERMISSION,
  FUNCTION,
  QUEUE,
  QUEUE_POLICY,
  NOTIFICATION,
  EVENT_SOURCE_MAPPING,
  DEPLOYMENT,
};

std::string_view resource_kind_name(resource_kind kind);

using env_map = std::map<std::string, std::string>;

struct table_spec {
  std::string name;
  std::string hash_key;
  std::string range_key;
  std::string billing_mode{ "PAY_PER_REQUEST" };
};

struct api_spec {
  std::string name;
  std::string description;
  std::string endpoint_type{ "EDGE" };
};

struct api_summary {
  std::string id;
  std::string name;
  std::int64_t created_epoch_ms{ 0 };
};

// One API Gateway path segment. Root is path "/" with no parent.
struct gateway_resource {
  std::string id;
  std::string path;
  std::optional<std::string> parent_id;
};

struct method_spec {
  std::string api_id;
  std::string resource_id;
  std::string http_method;
  std::string authorization{ "NONE" };
};

struct integration_spec {
  std::string api_id;
  std::string resource_id;
  std::string http_method;
  std::string type{ "AWS_PROXY" };
  std::string integration_http_method{ "POST" };
  std::string uri;
};

struct function_spec {
  std::string name;
  std::string runtime;
  std::string role_arn;
  std::string handler;
  int timeout_seconds{ 15 };
  env_map environment;
  std::vector<unsigned char> code;  // zip archive bytes
};

struct permission_grant {
  std::string function_name;
  std::string statement_id;
  std::string action{ "lambda:InvokeFunction" };
  std::string principal{ "apigateway.amazonaws.com" };
  std::string source_arn;
};

struct queue_identity {
  std::string name;
  std::string url;
  std::string arn;
};

struct notification_target {
  std::string queue_arn;
  std::vector<std::string> events;
};

struct notification_config {
  std::vector<notification_target> queue_configurations;
  // Function and topic targets, as "lambda:<arn>" / "topic:<arn>". Read so an
  // overwrite can name them; never written back.
  std::vector<std::string> other_targets;
};

struct event_source_mapping_spec {
  std::string function_name;
  std::string source_arn;
  int batch_size{ 10 };
  std::string starting_position{ "LATEST" };
};

struct event_source_mapping {
  std::string uuid;
  std::string function_name;
  std::string source_arn;
};

struct deployment_record {
  std::string api_id;
  std::string stage;
  std::string id;
};

}  // namespace strata
