#include "publisher.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

namespace strata {

deployment_record publish_deployment(resource_creator &creator,
                                     std::string const &api_id,
                                     std::string const &stage) {
  deployment_record record{ .api_id = api_id, .stage = stage };
  record.id = creator.create_deployment(api_id, stage);
  if (!identity_present(record.id)) {
    throw remote_error("create_deployment",
                       "EmptyIdentity",
                       "no deployment id returned for stage " + stage);
  }

  tui::info("Deployed API %s to stage %s (%s)",
            api_id.c_str(),
            stage.c_str(),
            record.id.c_str());
  STRATA_TRACE_DEPLOYMENT_PUBLISHED(api_id, stage, record.id);
  return record;
}

std::string endpoint_url(std::optional<std::string> const &endpoint,
                         std::string_view region,
                         std::string_view api_id,
                         std::string_view stage) {
  std::string out;
  if (endpoint && !endpoint->empty()) {
    out = *endpoint;
    while (!out.empty() && out.back() == '/') { out.pop_back(); }
    out.append("/restapis/").append(api_id).append("/").append(stage);
    out.append("/_user_request_/");
  } else {
    out.append("https://").append(api_id).append(".execute-api.").append(region);
    out.append(".amazonaws.com/").append(stage);
  }
  return out;
}

}  // namespace strata
