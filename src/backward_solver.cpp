#include "backward_solver.h"

#include "trace.h"
#include "tui.h"

#include <algorithm>

namespace mise {

step_window const &backward_solution::window(step_key key) const {
  return windows.at(key.recipe).at(key.step);
}

bool backward_solution::is_excluded(std::size_t recipe_index) const {
  return excluded.at(recipe_index);
}

std::size_t backward_solution::included_count() const {
  return static_cast<std::size_t>(std::ranges::count(excluded, false));
}

namespace {

std::vector<step_window> solve_chain(step_chain const &chain,
                                     instant meal_time,
                                     schedule_options const &options) {
  auto const n{ chain.steps.size() };
  std::vector<step_window> out(n);

  std::vector<int> prefix_nights(n, 0);
  int max_nights{ 0 };
  for (std::size_t i{ 0 }; i < n; ++i) {
    max_nights = std::max(max_nights, chain.steps[i]->nights_before_serving.value_or(0));
    prefix_nights[i] = max_nights;
  }

  instant finish{ meal_time - chain.steps.back()->hold_time };
  for (std::size_t i{ n }; i-- > 0;) {
    auto const &s{ *chain.steps[i] };
    auto &w{ out[i] };

    w.latest_finish = finish;
    w.latest_start = finish - step_blocking_span(s);

    if (s.minutes_before_serving) {
      w.latest_start = std::min(w.latest_start, meal_time - *s.minutes_before_serving);
    }

    if (int const nights{ s.nights_before_serving.value_or(0) }; nights > 0) {
      instant const day{ util_day_start(-nights) };
      w.latest_start = std::min(w.latest_start, day + options.pinned_time_of_day);
      w.earliest_start = day + options.kitchen_opens;
      w.pinned = true;
    }

    w.origin = util_day_start(-prefix_nights[i]) + options.kitchen_opens;
    finish = w.latest_start;
  }

  return out;
}

}  // namespace

backward_solution backward_solve(step_graph const &graph,
                                 instant meal_time,
                                 schedule_options const &options) {
  backward_solution result;
  result.windows.reserve(graph.chains.size());
  result.excluded.assign(graph.chains.size(), false);

  for (std::size_t r{ 0 }; r < graph.chains.size(); ++r) {
    auto const &chain{ graph.chains[r] };
    auto windows{ solve_chain(chain, meal_time, options) };

    for (std::size_t i{ 0 }; i < windows.size(); ++i) {
      auto const &s{ *chain.steps[i] };
      auto const &w{ windows[i] };
      MISE_TRACE_WINDOW_SOLVED(chain.source->id, s.id, w.latest_start.count(), w.pinned);

      instant const floor{ std::max(w.origin, w.earliest_start.value_or(w.origin)) };
      if (w.latest_start < floor && !result.excluded[r]) {
        result.excluded[r] = true;
        result.unmet.push_back(unmet_deadline{ .key = step_key{ r, i },
                                               .latest_start = w.latest_start,
                                               .origin = floor });
        MISE_TRACE_DEADLINE_UNMET(chain.source->id,
                                  s.id,
                                  w.latest_start.count(),
                                  floor.count());
        tui::warn("recipe '%s': step '%s' would have to start at %s, before %s",
                  chain.source->id.c_str(),
                  s.id.c_str(),
                  util_format_instant(w.latest_start).c_str(),
                  util_format_instant(floor).c_str());
      }
    }

    result.windows.push_back(std::move(windows));
  }

  tui::debug("backward solve: %zu of %zu recipes fit before %s",
             result.included_count(),
             graph.chains.size(),
             util_format_instant(meal_time).c_str());
  return result;
}

}  // namespace mise
