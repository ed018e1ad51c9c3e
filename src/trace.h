#pragma once

#include "run_stage.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace mise {

namespace trace_events {

struct stage_start {
  run_stage stage;
};

struct stage_complete {
  run_stage stage;
  std::int64_t duration_ms;
};

struct recipe_chained {
  std::string recipe;
  std::int64_t step_count;
};

struct window_solved {
  std::string recipe;
  std::string step;
  std::int64_t latest_start;  // minutes from 00:00 of the serving day
  bool pinned;
};

struct deadline_unmet {
  std::string recipe;
  std::string step;
  std::int64_t latest_start;
  std::int64_t origin;
};

struct partition_formed {
  std::int64_t temperature;
  std::int64_t run_count;
  std::int64_t step_count;
};

struct step_placed {
  std::string recipe;
  std::string step;
  std::string unit;
  std::int64_t start;
  std::int64_t end;
};

struct step_unplaced {
  std::string recipe;
  std::string step;
  std::string reason;
};

struct step_released {
  std::string recipe;
  std::string step;
  std::string unit;
};

struct repair_attempt {
  std::string recipe;
  std::string step;
  std::string strategy;
  std::int64_t window_start;
  std::int64_t window_end;
};

struct repair_complete {
  std::string recipe;
  std::string step;
  bool success;
  std::int64_t shift_minutes;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::stage_start,
                                   trace_events::stage_complete,
                                   trace_events::recipe_chained,
                                   trace_events::window_solved,
                                   trace_events::deadline_unmet,
                                   trace_events::partition_formed,
                                   trace_events::step_placed,
                                   trace_events::step_unplaced,
                                   trace_events::step_released,
                                   trace_events::repair_attempt,
                                   trace_events::repair_complete>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

struct stage_trace_scope {
  run_stage stage;
  std::chrono::steady_clock::time_point start;

  explicit stage_trace_scope(run_stage stage_value);
  ~stage_trace_scope();
};

}  // namespace mise

#define MISE_TRACE_UNLIKELY [[unlikely]]

#define MISE_TRACE_EMIT(event_expr) \
  do { \
    if (::mise::tui::g_trace_enabled) MISE_TRACE_UNLIKELY { \
        ::mise::tui::trace event_expr; \
      } \
  } while (0)

#define MISE_TRACE_STAGE_START(stage_value) \
  MISE_TRACE_EMIT((::mise::trace_events::stage_start{ \
      .stage = (stage_value), \
  }))

#define MISE_TRACE_STAGE_COMPLETE(stage_value, duration_value) \
  MISE_TRACE_EMIT((::mise::trace_events::stage_complete{ \
      .stage = (stage_value), \
      .duration_ms = (duration_value), \
  }))

#define MISE_TRACE_RECIPE_CHAINED(recipe_value, step_count_value) \
  MISE_TRACE_EMIT((::mise::trace_events::recipe_chained{ \
      .recipe = (recipe_value), \
      .step_count = (step_count_value), \
  }))

#define MISE_TRACE_WINDOW_SOLVED(recipe_value, step_value, latest_start_value, pinned_value) \
  MISE_TRACE_EMIT((::mise::trace_events::window_solved{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .latest_start = (latest_start_value), \
      .pinned = (pinned_value), \
  }))

#define MISE_TRACE_DEADLINE_UNMET(recipe_value, step_value, latest_start_value, origin_value) \
  MISE_TRACE_EMIT((::mise::trace_events::deadline_unmet{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .latest_start = (latest_start_value), \
      .origin = (origin_value), \
  }))

#define MISE_TRACE_PARTITION_FORMED(temperature_value, run_count_value, step_count_value) \
  MISE_TRACE_EMIT((::mise::trace_events::partition_formed{ \
      .temperature = (temperature_value), \
      .run_count = (run_count_value), \
      .step_count = (step_count_value), \
  }))

#define MISE_TRACE_STEP_PLACED(recipe_value, step_value, unit_value, start_value, end_value) \
  MISE_TRACE_EMIT((::mise::trace_events::step_placed{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .unit = (unit_value), \
      .start = (start_value), \
      .end = (end_value), \
  }))

#define MISE_TRACE_STEP_UNPLACED(recipe_value, step_value, reason_value) \
  MISE_TRACE_EMIT((::mise::trace_events::step_unplaced{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .reason = (reason_value), \
  }))

#define MISE_TRACE_STEP_RELEASED(recipe_value, step_value, unit_value) \
  MISE_TRACE_EMIT((::mise::trace_events::step_released{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .unit = (unit_value), \
  }))

#define MISE_TRACE_REPAIR_ATTEMPT(recipe_value, \
                                  step_value, \
                                  strategy_value, \
                                  window_start_value, \
                                  window_end_value) \
  MISE_TRACE_EMIT((::mise::trace_events::repair_attempt{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .strategy = (strategy_value), \
      .window_start = (window_start_value), \
      .window_end = (window_end_value), \
  }))

#define MISE_TRACE_REPAIR_COMPLETE(recipe_value, step_value, success_value, shift_value) \
  MISE_TRACE_EMIT((::mise::trace_events::repair_complete{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .success = (success_value), \
      .shift_minutes = (shift_value), \
  }))
