#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace strata {

class cmd_converge : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_converge> {
    int readiness_attempts{ 5 };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_converge(cfg cfg, std::optional<std::filesystem::path> const &config_path);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> config_path_;
};

}  // namespace strata
