#include "run_stage.h"

#include <array>

namespace mise {

namespace {

// Enum-to-string mapping (order must match run_stage enum in run_stage.h)
constinit std::array<std::string_view, run_stage_count> const run_stage_name_table{ {
    "building",          // run_stage::building (0)
    "backward_solved",   // run_stage::backward_solved (1)
    "allocated",         // run_stage::allocated (2)
    "resolved",          // run_stage::resolved (3)
    "conflicts_remain",  // run_stage::conflicts_remain (4)
    "reported",          // run_stage::reported (5)
    "malformed_recipe",  // run_stage::malformed_recipe (6)
    "unmet_deadline",    // run_stage::unmet_deadline (7)
} };

}  // namespace

std::string_view run_stage_name(run_stage s) {
  auto const idx{ static_cast<std::size_t>(s) };
  if (idx >= run_stage_name_table.size()) { return "unknown"; }
  return run_stage_name_table[idx];
}

}  // namespace mise
