#include "cmd_plan.h"

#include "meal_loader.h"
#include "report_json.h"
#include "reporter.h"
#include "scheduler.h"
#include "termination.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace mise {

void cmd_plan::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("plan", "Schedule a meal backward from its serving time") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("meal", cfg_ptr->meal_path, "Meal description (.lua)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_flag("--json", cfg_ptr->json, "Emit the schedule as JSON");
  sub->add_option("-o,--output", cfg_ptr->output_path, "Write the schedule to a file");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_plan::cmd_plan(cmd_plan::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_plan::execute() {
  auto const m{ meal_load(cfg_.meal_path) };
  auto const report{ schedule_meal(m, { .cancel = &termination_requested() }) };

  auto const rendered{ cfg_.json ? report_to_json(report) + "\n" : report_to_text(report) };
  if (cfg_.output_path) {
    util_write_file(*cfg_.output_path, rendered);
    tui::info("Wrote schedule to %s", cfg_.output_path->string().c_str());
  } else {
    tui::print_stdout("%s", rendered.c_str());
  }

  if (report.has_conflicts()) {
    tui::warn("schedule has %zu conflict%s",
              report.conflicts.size(),
              report.conflicts.size() == 1 ? "" : "s");
    return false;
  }
  return true;
}

}  // namespace mise
