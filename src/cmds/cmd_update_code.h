#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace strata {

class cmd_update_code : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_update_code> {
    std::string function_name;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_update_code(cfg cfg, std::optional<std::filesystem::path> const &config_path);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> config_path_;
};

}  // namespace strata
