#include "cmd_converge.h"

#include "aws_control_plane.h"
#include "deploy_config.h"
#include "orchestrator.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace strata {

void cmd_converge::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("converge",
                                "Create or adopt every resource of the image service") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--readiness-attempts",
                  cfg_ptr->readiness_attempts,
                  "Resource-tree reads before giving up on a new API")
      ->check(CLI::PositiveNumber);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_converge::cmd_converge(cmd_converge::cfg cfg,
                           std::optional<std::filesystem::path> const &config_path)
    : cfg_{ std::move(cfg) }, config_path_{ config_path } {}

void cmd_converge::execute() {
  auto dc{ deploy_config_load(config_path_) };
  tui::info("Converging %s in %s%s%s",
            dc.api.name.c_str(),
            dc.region.c_str(),
            dc.endpoint ? " via " : "",
            dc.endpoint ? dc.endpoint->c_str() : "");

  aws_control_plane plane{ aws_client_options{ .region = dc.region,
                                               .endpoint = dc.endpoint } };
  converge_options options{ .region = dc.region,
                            .account_id = dc.account_id,
                            .readiness_attempts = cfg_.readiness_attempts };

  orchestrator orch{ std::move(dc), plane, std::move(options) };
  auto const result{ orch.run() };

  for (auto const &[function_name, binding] : result.routes) {
    tui::debug("Route for %s: resource %s, statement %s",
               function_name.c_str(),
               binding.resource_id.c_str(),
               binding.statement_id.c_str());
  }
  tui::info("Converged: %d created, %d adopted, %d updated, %d unchanged",
            result.summary.created,
            result.summary.adopted,
            result.summary.updated,
            result.summary.skipped);
  tui::print_stdout("%s\n", result.endpoint_url.c_str());
}

}  // namespace strata
