#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace mise {

// Loads a meal file and runs the structural recipe checks without scheduling.
class cmd_check : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_check> {
    std::filesystem::path meal_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_check(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace mise
