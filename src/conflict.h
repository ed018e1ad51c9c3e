#pragma once

#include "step_graph.h"
#include "util.h"

#include <string>
#include <string_view>
#include <vector>

namespace mise {

enum class conflict_kind : int {
  unmet_deadline = 0,
  equipment_overbooked = 1,    // temperature clash on an oven
  insufficient_rack_space = 2,  // same temperature, no row fits
  burner_overbooked = 3,
};

constexpr int conflict_kind_count = 4;

std::string_view conflict_kind_name(conflict_kind k);

enum class conflict_status {
  fatal,       // recipe excluded before allocation
  unresolved,  // the single repair attempt failed
};

std::string_view conflict_status_name(conflict_status s);

struct conflict {
  conflict_kind kind;
  conflict_status status;
  step_key key;
  std::string equipment;             // unit id; empty when no unit is involved
  std::vector<step_key> blockers;    // placed steps standing in the way
  instant window_start;
  instant window_end;
  std::string message;
};

// One-line, human-readable diagnosis naming the step, the unit and the blockers.
std::string conflict_describe(conflict const &c, step_graph const &graph);

}  // namespace mise
