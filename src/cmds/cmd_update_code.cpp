#include "cmd_update_code.h"

#include "aws_control_plane.h"
#include "deploy_config.h"
#include "orchestrator.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace strata {

void cmd_update_code::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("update-code",
                                "Re-package and upload one function's code") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("function", cfg_ptr->function_name, "Function name")->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_update_code::cmd_update_code(cmd_update_code::cfg cfg,
                                 std::optional<std::filesystem::path> const &config_path)
    : cfg_{ std::move(cfg) }, config_path_{ config_path } {}

void cmd_update_code::execute() {
  auto dc{ deploy_config_load(config_path_) };
  aws_control_plane plane{ aws_client_options{ .region = dc.region,
                                               .endpoint = dc.endpoint } };
  converge_options options{ .region = dc.region, .account_id = dc.account_id };

  orchestrator orch{ std::move(dc), plane, std::move(options) };
  orch.update_code(cfg_.function_name);
}

}  // namespace strata
