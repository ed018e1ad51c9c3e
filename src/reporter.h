#pragma once

#include "allocator.h"
#include "backward_solver.h"
#include "conflict.h"
#include "conflict_resolver.h"
#include "meal.h"
#include "run_stage.h"
#include "step_graph.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mise {

struct assignment {
  std::string recipe_id;
  std::string step_id;
  std::string recipe_name;
  std::string step_name;
  equipment_kind kind{ equipment_kind::none };
  std::string equipment;  // unit id; empty for counter work
  instant start{ 0 };
  instant end{ 0 };
  instant ready{ 0 };
  std::optional<int> rack_row;
  std::optional<int> temperature;
  std::optional<int> burners;
  bool pinned{ false };
};

enum class timeline_action { begin, end, rest_complete, serve };

std::string_view timeline_action_name(timeline_action a);

struct timeline_entry {
  instant at;
  timeline_action action;
  std::string recipe_id;  // empty for the serve entry
  std::string step_id;
  std::string equipment;
  std::string description;
};

struct load_change {
  instant at;
  int value;  // temperature for ovens, burners in use for the stovetop (0 = idle)
};

struct unit_utilization {
  std::string id;
  equipment_kind kind{ equipment_kind::oven };
  std::optional<instant> first_start;
  std::optional<instant> last_end;
  minutes busy{ 0 };
  std::vector<load_change> changes;
  int temperature_changes{ 0 };  // ovens: switches between distinct temperatures
  int peak_burners{ 0 };         // stovetop only
};

struct reported_conflict {
  conflict_kind kind;
  conflict_status status;
  std::string recipe_id;
  std::string step_id;
  std::string equipment;
  std::vector<std::string> blockers;  // "recipe/step"
  instant window_start;
  instant window_end;
  std::string message;
};

struct schedule_checks {
  bool all_ready_by_meal_time{ true };
  bool no_equipment_overbooked{ true };
};

struct category_count {
  recipe_category category;
  int dishes;
};

struct schedule_report {
  std::string meal_name;
  std::optional<std::chrono::year_month_day> meal_date;
  instant meal_time{ 0 };
  int guest_count{ 0 };

  std::vector<run_stage> stages;
  std::vector<assignment> assignments;  // chronological
  std::vector<timeline_entry> timeline;
  std::vector<unit_utilization> utilization;
  std::vector<reported_conflict> conflicts;
  std::vector<std::string> warnings;
  std::vector<category_count> categories;
  schedule_checks checks;

  bool has_conflicts() const { return !conflicts.empty(); }
};

struct report_inputs {
  meal const &source;
  step_graph const &graph;
  backward_solution const &solution;
  equipment_allocator const *allocator;  // null when nothing was allocated
  std::vector<conflict> const &conflicts;
  std::vector<std::string> const &warnings;
  std::vector<run_stage> const &stages;
};

schedule_report report_build(report_inputs const &in);

// Both checks derive from the conflict list alone.
schedule_checks report_checks(std::vector<reported_conflict> const &conflicts);

// Plain-text rendering for the terminal.
std::string report_to_text(schedule_report const &report);

}  // namespace mise
