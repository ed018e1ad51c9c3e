#pragma once

#include <string_view>

namespace mise {

enum class run_stage : int {
  building = 0,
  backward_solved = 1,
  allocated = 2,
  resolved = 3,
  conflicts_remain = 4,
  reported = 5,
  malformed_recipe = 6,  // Terminal: input rejected before solving
  unmet_deadline = 7,    // Terminal for allocation: no recipe fits before meal time
};

constexpr int run_stage_count = 8;

std::string_view run_stage_name(run_stage s);

}  // namespace mise
