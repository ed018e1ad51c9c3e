#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace mise {

class cmd_plan : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_plan> {
    std::filesystem::path meal_path;
    bool json{ false };
    std::optional<std::filesystem::path> output_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_plan(cfg cfg);

  // False when conflicts remain in the schedule.
  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace mise
