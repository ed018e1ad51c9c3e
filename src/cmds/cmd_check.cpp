#include "cmd_check.h"

#include "meal_loader.h"
#include "step_graph.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace mise {

void cmd_check::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("check", "Validate a meal file without scheduling it") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("meal", cfg_ptr->meal_path, "Meal description (.lua)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_check::cmd_check(cmd_check::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_check::execute() {
  auto const m{ meal_load(cfg_.meal_path) };
  equipment_cfg_validate(m.equipment);
  auto const graph{ step_graph_build(m.recipes) };

  tui::info("%s: %zu recipes, %zu step groups, %zu ovens, %d burners",
            cfg_.meal_path.string().c_str(),
            graph.chains.size(),
            graph.step_count(),
            m.equipment.ovens.size(),
            m.equipment.stovetop_burners);
  return true;
}

}  // namespace mise
