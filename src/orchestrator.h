#pragma once

#include "control_plane.h"
#include "converger.h"
#include "deploy_config.h"
#include "resource.h"
#include "util.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace strata {

// Zip bytes for a function; the default packs sources with code_package_build.
using code_loader_t = std::function<std::vector<unsigned char>(function_cfg const &)>;

struct convergence_result {
  std::string api_id;
  std::string root_resource_id;
  std::map<std::string, route_binding> routes;  // function name -> binding
  queue_identity queue;
  std::string event_source_mapping_uuid;
  deployment_record deployment;
  std::string endpoint_url;
  run_summary summary;
};

// Runs the whole topology in dependency order: bucket, table, API shell, each
// function with its route, queue wiring, then a fresh deployment. Any failure stops
// the run with a convergence_error naming the step and resource key; whatever was
// created before it stays.
class orchestrator : unmovable {
 public:
  orchestrator(deploy_config cfg,
               control_plane &plane,
               converge_options options,
               code_loader_t code_loader = {});

  convergence_result run();

  // Re-package and upload one function's code, nothing else.
  void update_code(std::string const &function_name);

 private:
  struct prepared_function {
    function_cfg const *cfg;
    function_spec spec;
  };

  std::vector<prepared_function> prepare();

  template <typename Fn>
  auto step(char const *name, std::string const &key, Fn &&fn) -> decltype(fn());

  deploy_config cfg_;
  control_plane &plane_;
  converge_options options_;
  code_loader_t code_loader_;
};

}  // namespace strata
