#pragma once

#include "backward_solver.h"
#include "conflict.h"
#include "meal.h"
#include "step_graph.h"
#include "util.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mise {

struct placement {
  step_key key;
  equipment_kind kind{ equipment_kind::none };
  std::size_t unit_index{ 0 };  // index into equipment_cfg::ovens when kind == oven
  std::string unit_id;          // empty for counter work
  instant start{ 0 };
  instant end{ 0 };
  instant ready{ 0 };  // end + rest: earliest start of the next step
  int rack_row{ -1 };
  int temperature{ 0 };
  int height_slots{ 0 };
  rack_width width{ rack_width::full };
  int burners{ 0 };
};

// Place `key` at the latest feasible start in [window_start, window_end].
struct slot_request {
  step_key key;
  instant window_start;
  instant window_end;
};

struct slot_result {
  std::optional<placement> placed;
  conflict_kind reason{ conflict_kind::equipment_overbooked };
  std::string equipment;
  std::vector<step_key> blockers;
};

struct unplaced_step {
  step_key key;
  conflict_kind reason;
  std::string equipment;
  std::vector<step_key> blockers;
  instant window_start;
  instant window_end;
};

// Same-temperature oven steps whose windows overlap; the allocator prefers to keep a
// partition on one unit.
struct temperature_partition {
  int id;
  int temperature;
  std::vector<step_key> steps;
};

class equipment_allocator : unmovable {
 public:
  using state = std::vector<std::optional<placement>>;

  equipment_allocator(step_graph const &graph,
                      backward_solution const &solution,
                      equipment_cfg const &equipment,
                      schedule_options const &options);

  // Greedy first pass over every included recipe. Steps become candidates once their
  // successor is decided; candidates go least flexible, then longest, first.
  void allocate();

  // Commits on success; leaves the ledger untouched on failure.
  slot_result place(slot_request const &request);
  std::optional<placement> release(step_key key);

  placement const *placement_of(step_key key) const;

  // Latest start that keeps the chain ordered against the successor (placed or not).
  instant upper_bound(step_key key) const;

  // Earliest start the step may ever take: its origin, or its pinned day's opening.
  instant lower_bound(step_key key) const;

  // lower_bound raised by the blocking spans of the predecessors, each one starting no
  // earlier than its own lower_bound.
  instant chain_lower_bound(step_key key) const;

  std::vector<placement> placements() const;  // chronological
  std::vector<unplaced_step> const &unplaced() const { return unplaced_; }

  // Partitions only break ties: between units offering the same latest start, one
  // already hosting the step's partition wins.
  std::vector<temperature_partition> const &partitions() const { return partitions_; }

  state snapshot() const { return placed_; }
  void restore(state saved);

  step_graph const &graph() const { return graph_; }
  backward_solution const &solution() const { return solution_; }
  equipment_cfg const &equipment() const { return equipment_; }

 private:
  struct unit_probe {
    std::optional<instant> start;
    int row{ -1 };
    conflict_kind reason{ conflict_kind::equipment_overbooked };
    std::vector<step_key> blockers;
  };

  std::size_t flat(step_key key) const { return graph_.input_order(key); }
  void form_partitions();
  bool hosts_partition(std::size_t unit, step_key key) const;
  bool priority_less(step_key a, step_key b) const;

  unit_probe probe_oven(std::size_t unit,
                        step_key key,
                        oven_need const &need,
                        instant lo,
                        instant hi) const;
  unit_probe probe_stovetop(step_key key,
                            stovetop_need const &need,
                            instant lo,
                            instant hi) const;
  unit_probe fit_oven(std::size_t unit,
                      step_key key,
                      oven_need const &need,
                      instant start,
                      instant end) const;
  unit_probe fit_stovetop(step_key key,
                          stovetop_need const &need,
                          instant start,
                          instant end) const;

  // Latest-first candidate starts in [lo, hi] for a step of length `duration` on the
  // placements matching `on_unit`.
  template <typename Pred>
  std::vector<instant> candidate_starts(instant lo,
                                        instant hi,
                                        minutes duration,
                                        Pred on_unit) const;

  slot_result place_oven(step_key key, oven_need const &need, instant lo, instant hi);
  slot_result place_stovetop(step_key key,
                             stovetop_need const &need,
                             instant lo,
                             instant hi);
  void commit(placement p);

  step_graph const &graph_;
  backward_solution const &solution_;
  equipment_cfg const &equipment_;
  schedule_options const &options_;

  std::vector<step_key> keys_;     // by input order
  std::vector<int> partition_of_;  // by input order; -1 when not an oven step
  std::vector<temperature_partition> partitions_;
  state placed_;                   // by input order
  std::vector<unplaced_step> unplaced_;
};

}  // namespace mise
