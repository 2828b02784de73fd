#pragma once

#include "control_plane.h"
#include "resource.h"

#include <optional>
#include <string>
#include <string_view>

namespace strata {

// Creates a new deployment of the API's current method graph on `stage`. Runs on
// every convergence pass, whether or not anything changed.
deployment_record publish_deployment(resource_creator &creator,
                                     std::string const &api_id,
                                     std::string const &stage);

// Invoke URL for a stage. With an endpoint override (LocalStack style) this is
// <endpoint>/restapis/<id>/<stage>/_user_request_/; otherwise the public
// execute-api host.
std::string endpoint_url(std::optional<std::string> const &endpoint,
                         std::string_view region,
                         std::string_view api_id,
                         std::string_view stage);

}  // namespace strata
