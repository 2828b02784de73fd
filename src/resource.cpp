#include "resource.h"

namespace strata {

std::string_view resource_kind_name(resource_kind kind) {
  switch (kind) {
    case resource_kind::BUCKET: return "bucket";
    case resource_kind::TABLE: return "table";
    case resource_kind::API: return "api";
    case resource_kind::GATEWAY_RESOURCE: return "gateway_resource";
    case resource_kind::METHOD: return "method";
    case resource_kind::INTEGRATION: return "integration";
    case resource_kind::PERMISSION: return "permission";
    case resource_kind::FUNCTION: return "function";
    case resource_kind::QUEUE: return "queue";
    case resource_kind::QUEUE_POLICY: return "queue_policy";
    case resource_kind::NOTIFICATION: return "notification";
    case resource_kind::EVENT_SOURCE_MAPPING: return "event_source_mapping";
    case resource_kind::DEPLOYMENT: return "deployment";
  }
  return "unknown";
}

}  // namespace strata
