#pragma once

#include "cmds/cmd_converge.h"
#include "cmds/cmd_update_code.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_converge::cfg, cmd_update_code::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<std::filesystem::path> config_path;  // --config strata.lua
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

// With no subcommand, converge is selected.
cli_args cli_parse(int argc, char **argv);

}  // namespace strata
