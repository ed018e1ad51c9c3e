#pragma once

#include "meal.h"
#include "step_graph.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace mise {

// Contention-free window of one step. Instants are minutes from 00:00 of the
// serving day.
struct step_window {
  std::optional<instant> earliest_start;  // set only for pinned steps
  instant latest_start{ 0 };
  instant latest_finish{ 0 };  // latest end + rest: the next step's latest start
  instant origin{ 0 };         // kitchen opening on the first day the recipe uses
  bool pinned{ false };
};

struct unmet_deadline {
  step_key key;
  instant latest_start;
  instant origin;
};

struct backward_solution {
  std::vector<std::vector<step_window>> windows;  // [recipe][step in chain order]
  std::vector<unmet_deadline> unmet;              // at most one per recipe
  std::vector<bool> excluded;                     // [recipe]

  step_window const &window(step_key key) const;
  bool is_excluded(std::size_t recipe_index) const;
  std::size_t included_count() const;
};

// Walks every chain backward from meal_time. Recipes whose windows fall before their
// origin are excluded and reported in `unmet`.
backward_solution backward_solve(step_graph const &graph,
                                 instant meal_time,
                                 schedule_options const &options);

}  // namespace mise
