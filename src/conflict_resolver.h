#pragma once

#include "allocator.h"
#include "backward_solver.h"
#include "conflict.h"
#include "meal.h"
#include "step_graph.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mise {

struct repair_context {
  step_key key;
  step_group const &step;
  step_window const &window;
  instant lower_bound;  // earliest start the whole chain before the step allows
  instant upper_bound;  // latest start keeping the chain ordered
};

struct repair_window {
  instant start;
  instant end;
};

// Proposes the window for the single repair attempt of an unplaced step.
class repair_strategy {
 public:
  virtual ~repair_strategy() = default;
  virtual std::string_view name() const = 0;
  virtual std::optional<repair_window> propose(repair_context const &ctx) const = 0;
};

// Moves the step earlier by at most its max wait; unlimited wait reaches back to the
// lower bound.
class shift_earlier_strategy : public repair_strategy {
 public:
  std::string_view name() const override { return "shift_earlier"; }
  std::optional<repair_window> propose(repair_context const &ctx) const override;
};

struct resolution {
  std::vector<conflict> conflicts;  // unresolved, in the order the steps went unplaced
  std::vector<std::string> warnings;
  std::size_t repaired{ 0 };
};

// One repair attempt per unplaced step. A successful attempt shifts placed
// predecessors earlier as needed; if any of them cannot move, the attempt is rolled
// back.
resolution conflict_resolve(equipment_allocator &allocator, repair_strategy const &strategy);

// Fatal conflicts for recipes the backward solver excluded.
std::vector<conflict> conflict_from_unmet(step_graph const &graph,
                                          backward_solution const &solution);

}  // namespace mise
