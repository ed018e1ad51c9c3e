#include "scheduler.h"

#include "allocator.h"
#include "backward_solver.h"
#include "step_graph.h"
#include "trace.h"
#include "tui.h"

#include <string>
#include <utility>
#include <vector>

namespace mise {

schedule_cancelled::schedule_cancelled(run_stage stage)
    : std::runtime_error{ "scheduling cancelled before stage '" +
                          std::string{ run_stage_name(stage) } + "'" },
      stage_{ stage } {}

namespace {

class stage_log {
 public:
  explicit stage_log(std::atomic_bool const *cancel) : cancel_{ cancel } {}

  void enter(run_stage stage) {
    if (cancel_ && cancel_->load()) { throw schedule_cancelled{ stage }; }
    tui::debug("schedule: -> %s", std::string{ run_stage_name(stage) }.c_str());
    stages_.push_back(stage);
  }

  std::vector<run_stage> const &stages() const { return stages_; }

 private:
  std::atomic_bool const *cancel_;
  std::vector<run_stage> stages_;
};

}  // namespace

schedule_report schedule_meal(meal const &input, schedule_controls const &controls) {
  meal const frozen{ input };
  equipment_cfg_validate(frozen.equipment);

  stage_log log{ controls.cancel };
  log.enter(run_stage::building);

  step_graph graph;
  {
    stage_trace_scope const scope{ run_stage::building };
    graph = step_graph_build(frozen.recipes);
  }

  backward_solution solution;
  {
    stage_trace_scope const scope{ run_stage::backward_solved };
    solution = backward_solve(graph, frozen.meal_time, frozen.options);
  }
  log.enter(run_stage::backward_solved);

  auto conflicts{ conflict_from_unmet(graph, solution) };
  std::vector<std::string> warnings;

  if (!solution.unmet.empty() && solution.included_count() == 0) {
    log.enter(run_stage::unmet_deadline);
    log.enter(run_stage::reported);
    tui::warn("schedule: no recipe fits before meal time");
    return report_build({ .source = frozen,
                          .graph = graph,
                          .solution = solution,
                          .allocator = nullptr,
                          .conflicts = conflicts,
                          .warnings = warnings,
                          .stages = log.stages() });
  }

  equipment_allocator allocator{ graph, solution, frozen.equipment, frozen.options };
  {
    stage_trace_scope const scope{ run_stage::allocated };
    allocator.allocate();
  }
  log.enter(run_stage::allocated);

  shift_earlier_strategy const default_strategy{};
  resolution resolved;
  {
    stage_trace_scope const scope{ run_stage::resolved };
    resolved = conflict_resolve(allocator,
                                controls.strategy ? *controls.strategy : default_strategy);
  }

  for (auto &c : resolved.conflicts) { conflicts.push_back(std::move(c)); }
  warnings = std::move(resolved.warnings);
  log.enter(conflicts.empty() ? run_stage::resolved : run_stage::conflicts_remain);

  log.enter(run_stage::reported);
  auto report{ report_build({ .source = frozen,
                              .graph = graph,
                              .solution = solution,
                              .allocator = &allocator,
                              .conflicts = conflicts,
                              .warnings = warnings,
                              .stages = log.stages() }) };

  tui::info("schedule: %zu steps placed, %zu repaired, %zu conflicts",
            report.assignments.size(),
            resolved.repaired,
            report.conflicts.size());
  return report;
}

}  // namespace mise
