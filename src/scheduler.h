#pragma once

#include "conflict_resolver.h"
#include "meal.h"
#include "reporter.h"
#include "run_stage.h"

#include <atomic>
#include <stdexcept>

namespace mise {

class schedule_cancelled : public std::runtime_error {
 public:
  explicit schedule_cancelled(run_stage stage);

  // The stage the run was about to enter.
  run_stage stage() const { return stage_; }

 private:
  run_stage stage_;
};

struct schedule_controls {
  std::atomic_bool const *cancel{ nullptr };   // checked at every stage transition
  repair_strategy const *strategy{ nullptr };  // defaults to shift_earlier_strategy
};

// Schedules a frozen copy of `input`. Throws malformed_recipe for structural defects,
// std::runtime_error for bad equipment, schedule_cancelled when cancelled. Every other
// outcome, conflicts included, is a report.
schedule_report schedule_meal(meal const &input, schedule_controls const &controls = {});

}  // namespace mise
