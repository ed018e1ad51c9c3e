#include "allocator.h"

#include "trace.h"
#include "tui.h"

#include "tbb/task_group.h"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <utility>

namespace mise {

namespace {

bool overlaps(placement const &p, instant start, instant end) {
  return p.start < end && start < p.end;
}

void merge_blockers(std::vector<step_key> &into, std::vector<step_key> const &from) {
  into.insert(into.end(), from.begin(), from.end());
  std::ranges::sort(into);
  auto const dup{ std::ranges::unique(into) };
  into.erase(dup.begin(), dup.end());
}

std::vector<step_key> keys_of(std::vector<placement const *> const &items) {
  std::vector<step_key> out;
  out.reserve(items.size());
  for (auto const *p : items) { out.push_back(p->key); }
  std::ranges::sort(out);
  return out;
}

// Every instant in [start, end) where the set of active items can grow.
std::vector<instant> sweep_points(std::vector<placement const *> const &items,
                                  instant start,
                                  instant end) {
  std::vector<instant> points{ start };
  for (auto const *p : items) {
    if (p->start > start && p->start < end) { points.push_back(p->start); }
  }
  return points;
}

bool half_row_fits(std::vector<placement const *> const &row_items,
                   int height,
                   int positions,
                   instant start,
                   instant end) {
  for (instant const at : sweep_points(row_items, start, end)) {
    int count{ 1 };
    int used{ height };
    for (auto const *p : row_items) {
      if (p->start <= at && at < p->end) {
        ++count;
        used += p->height_slots;
      }
    }
    if (count > 2 || used > positions) { return false; }
  }
  return true;
}

}  // namespace

equipment_allocator::equipment_allocator(step_graph const &graph,
                                         backward_solution const &solution,
                                         equipment_cfg const &equipment,
                                         schedule_options const &options)
    : graph_{ graph }, solution_{ solution }, equipment_{ equipment }, options_{ options } {
  auto const n{ graph_.step_count() };
  keys_.resize(n);
  partition_of_.assign(n, -1);
  placed_.resize(n);

  for (std::size_t r{ 0 }; r < graph_.chains.size(); ++r) {
    for (std::size_t i{ 0 }; i < graph_.chain_length(r); ++i) {
      step_key const key{ r, i };
      keys_[flat(key)] = key;
    }
  }

  form_partitions();
}

void equipment_allocator::form_partitions() {
  struct span {
    step_key key;
    instant lo;
    instant hi;
  };

  std::map<int, std::vector<span>> by_temperature;
  for (auto const key : keys_) {
    if (solution_.is_excluded(key.recipe)) { continue; }
    auto const &s{ graph_.step(key) };
    auto const *need{ std::get_if<oven_need>(&s.equipment) };
    if (!need) { continue; }

    auto const &w{ solution_.window(key) };
    by_temperature[need->temperature].push_back(
        span{ .key = key,
              .lo = w.earliest_start.value_or(w.latest_start),
              .hi = w.latest_start + s.duration });
  }

  for (auto &[temperature, spans] : by_temperature) {
    std::ranges::stable_sort(spans, {}, &span::lo);

    std::int64_t runs{ 0 };
    std::optional<instant> run_end;
    for (auto const &sp : spans) {
      if (!run_end || sp.lo >= *run_end) {
        partitions_.push_back(temperature_partition{
            .id = static_cast<int>(partitions_.size()),
            .temperature = temperature,
            .steps = {} });
        run_end = sp.hi;
        ++runs;
      }
      run_end = std::max(*run_end, sp.hi);
      partitions_.back().steps.push_back(sp.key);
      partition_of_[flat(sp.key)] = partitions_.back().id;
    }

    MISE_TRACE_PARTITION_FORMED(temperature, runs, static_cast<std::int64_t>(spans.size()));
  }
}

instant equipment_allocator::upper_bound(step_key key) const {
  auto const &w{ solution_.window(key) };
  if (graph_.is_last(key)) { return w.latest_start; }

  step_key const next{ key.recipe, key.step + 1 };
  auto const *succ{ placement_of(next) };
  instant const succ_start{ succ ? succ->start : upper_bound(next) };
  return std::min(w.latest_start, succ_start - step_blocking_span(graph_.step(key)));
}

instant equipment_allocator::lower_bound(step_key key) const {
  auto const &w{ solution_.window(key) };
  return std::max(w.origin, w.earliest_start.value_or(w.origin));
}

instant equipment_allocator::chain_lower_bound(step_key key) const {
  instant earliest{ lower_bound({ key.recipe, 0 }) };
  for (std::size_t i{ 1 }; i <= key.step; ++i) {
    step_key const prev{ key.recipe, i - 1 };
    earliest = std::max(lower_bound({ key.recipe, i }),
                        earliest + step_blocking_span(graph_.step(prev)));
  }
  return earliest;
}

placement const *equipment_allocator::placement_of(step_key key) const {
  auto const &slot{ placed_.at(flat(key)) };
  return slot ? &*slot : nullptr;
}

std::vector<placement> equipment_allocator::placements() const {
  std::vector<placement> out;
  for (auto const &slot : placed_) {
    if (slot) { out.push_back(*slot); }
  }
  std::ranges::stable_sort(out, [](placement const &a, placement const &b) {
    return a.start < b.start;
  });
  return out;
}

void equipment_allocator::restore(state saved) {
  if (saved.size() != placed_.size()) {
    throw std::logic_error{ "equipment_allocator::restore: snapshot size mismatch" };
  }
  placed_ = std::move(saved);
}

bool equipment_allocator::priority_less(step_key a, step_key b) const {
  auto const &sa{ graph_.step(a) };
  auto const &sb{ graph_.step(b) };

  if (sa.max_wait != sb.max_wait) {
    if (!sa.max_wait) { return false; }
    if (!sb.max_wait) { return true; }
    return *sa.max_wait < *sb.max_wait;
  }
  if (sa.duration != sb.duration) { return sa.duration > sb.duration; }
  return flat(a) < flat(b);
}

bool equipment_allocator::hosts_partition(std::size_t unit, step_key key) const {
  int const partition{ partition_of_[flat(key)] };
  if (partition < 0) { return false; }
  return std::ranges::any_of(placed_, [&](std::optional<placement> const &p) {
    return p && p->kind == equipment_kind::oven && p->unit_index == unit &&
           partition_of_[flat(p->key)] == partition;
  });
}

template <typename Pred>
std::vector<instant> equipment_allocator::candidate_starts(instant lo,
                                                           instant hi,
                                                           minutes duration,
                                                           Pred on_unit) const {
  std::vector<instant> out{ hi };
  for (auto const &slot : placed_) {
    if (!slot || !on_unit(*slot)) { continue; }
    instant const t{ slot->start - duration };
    if (t >= lo && t < hi) { out.push_back(t); }
  }
  std::ranges::sort(out, std::greater<>{});
  auto const dup{ std::ranges::unique(out) };
  out.erase(dup.begin(), dup.end());
  return out;
}

equipment_allocator::unit_probe equipment_allocator::fit_oven(std::size_t unit,
                                                              step_key key,
                                                              oven_need const &need,
                                                              instant start,
                                                              instant end) const {
  auto const &oven{ equipment_.ovens[unit] };

  std::vector<placement const *> active;
  for (auto const &slot : placed_) {
    if (slot && slot->kind == equipment_kind::oven && slot->unit_index == unit &&
        slot->key != key && overlaps(*slot, start, end)) {
      active.push_back(&*slot);
    }
  }

  std::vector<placement const *> clash;
  for (auto const *p : active) {
    if (p->temperature != need.temperature) { clash.push_back(p); }
  }
  if (!clash.empty()) {
    return { .reason = conflict_kind::equipment_overbooked, .blockers = keys_of(clash) };
  }

  if (need.height_slots <= oven.rack_positions) {
    for (int row{ 0 }; row < oven.physical_racks; ++row) {
      std::vector<placement const *> row_items;
      for (auto const *p : active) {
        if (p->rack_row == row) { row_items.push_back(p); }
      }

      if (need.width == rack_width::full) {
        if (row_items.empty()) { return { .start = start, .row = row }; }
        continue;
      }

      bool const row_has_full{ std::ranges::any_of(row_items, [](placement const *p) {
        return p->width == rack_width::full;
      }) };
      if (!row_has_full &&
          half_row_fits(row_items, need.height_slots, oven.rack_positions, start, end)) {
        return { .start = start, .row = row };
      }
    }
  }

  return { .reason = conflict_kind::insufficient_rack_space, .blockers = keys_of(active) };
}

equipment_allocator::unit_probe equipment_allocator::fit_stovetop(step_key key,
                                                                  stovetop_need const &need,
                                                                  instant start,
                                                                  instant end) const {
  std::vector<placement const *> active;
  for (auto const &slot : placed_) {
    if (slot && slot->kind == equipment_kind::stovetop && slot->key != key &&
        overlaps(*slot, start, end)) {
      active.push_back(&*slot);
    }
  }

  bool fits{ need.burners <= equipment_.stovetop_burners };
  for (instant const at : sweep_points(active, start, end)) {
    if (!fits) { break; }
    int load{ need.burners };
    for (auto const *p : active) {
      if (p->start <= at && at < p->end) { load += p->burners; }
    }
    fits = load <= equipment_.stovetop_burners;
  }

  if (fits) { return { .start = start }; }
  return { .reason = conflict_kind::burner_overbooked, .blockers = keys_of(active) };
}

equipment_allocator::unit_probe equipment_allocator::probe_oven(std::size_t unit,
                                                                step_key key,
                                                                oven_need const &need,
                                                                instant lo,
                                                                instant hi) const {
  auto const duration{ graph_.step(key).duration };
  auto const starts{ candidate_starts(lo, hi, duration, [&](placement const &p) {
    return p.kind == equipment_kind::oven && p.unit_index == unit;
  }) };

  unit_probe failure;
  for (std::size_t i{ 0 }; i < starts.size(); ++i) {
    auto probe{ fit_oven(unit, key, need, starts[i], starts[i] + duration) };
    if (probe.start) { return probe; }
    if (i == 0) { failure.reason = probe.reason; }
    merge_blockers(failure.blockers, probe.blockers);
  }
  return failure;
}

equipment_allocator::unit_probe equipment_allocator::probe_stovetop(step_key key,
                                                                    stovetop_need const &need,
                                                                    instant lo,
                                                                    instant hi) const {
  auto const duration{ graph_.step(key).duration };
  auto const starts{ candidate_starts(lo, hi, duration, [](placement const &p) {
    return p.kind == equipment_kind::stovetop;
  }) };

  unit_probe failure{ .reason = conflict_kind::burner_overbooked };
  for (instant const start : starts) {
    auto probe{ fit_stovetop(key, need, start, start + duration) };
    if (probe.start) { return probe; }
    merge_blockers(failure.blockers, probe.blockers);
  }
  return failure;
}

slot_result equipment_allocator::place_oven(step_key key,
                                            oven_need const &need,
                                            instant lo,
                                            instant hi) {
  auto const unit_count{ equipment_.ovens.size() };
  if (unit_count == 0) { return { .reason = conflict_kind::equipment_overbooked }; }

  std::vector<unit_probe> probes(unit_count);
  if (options_.parallel && unit_count > 1) {
    tbb::task_group tg;
    for (std::size_t u{ 0 }; u < unit_count; ++u) {
      tg.run([&, u]() { probes[u] = probe_oven(u, key, need, lo, hi); });
    }
    tg.wait();
  } else {
    for (std::size_t u{ 0 }; u < unit_count; ++u) {
      probes[u] = probe_oven(u, key, need, lo, hi);
    }
  }

  std::optional<std::size_t> best;
  bool best_hosts{ false };
  for (std::size_t u{ 0 }; u < unit_count; ++u) {
    if (!probes[u].start) { continue; }
    bool const hosts{ hosts_partition(u, key) };
    if (!best || *probes[u].start > *probes[*best].start ||
        (*probes[u].start == *probes[*best].start && hosts && !best_hosts)) {
      best = u;
      best_hosts = hosts;
    }
  }

  if (best) {
    auto const &s{ graph_.step(key) };
    auto const &probe{ probes[*best] };
    return { .placed = placement{ .key = key,
                                  .kind = equipment_kind::oven,
                                  .unit_index = *best,
                                  .unit_id = equipment_.ovens[*best].id,
                                  .start = *probe.start,
                                  .end = *probe.start + s.duration,
                                  .ready = *probe.start + step_blocking_span(s),
                                  .rack_row = probe.row,
                                  .temperature = need.temperature,
                                  .height_slots = need.height_slots,
                                  .width = need.width } };
  }

  // Rack space outranks a temperature clash: some unit could have hosted the
  // temperature.
  slot_result failure{ .reason = conflict_kind::equipment_overbooked };
  for (auto const &probe : probes) {
    if (probe.reason == conflict_kind::insufficient_rack_space) {
      failure.reason = conflict_kind::insufficient_rack_space;
    }
  }
  for (std::size_t u{ 0 }; u < unit_count; ++u) {
    if (failure.equipment.empty() && probes[u].reason == failure.reason) {
      failure.equipment = equipment_.ovens[u].id;
    }
    merge_blockers(failure.blockers, probes[u].blockers);
  }
  return failure;
}

slot_result equipment_allocator::place_stovetop(step_key key,
                                                stovetop_need const &need,
                                                instant lo,
                                                instant hi) {
  auto const probe{ probe_stovetop(key, need, lo, hi) };
  if (!probe.start) {
    return { .reason = probe.reason,
             .equipment = std::string{ equipment_cfg::kStovetopId },
             .blockers = probe.blockers };
  }

  auto const &s{ graph_.step(key) };
  return { .placed = placement{ .key = key,
                                .kind = equipment_kind::stovetop,
                                .unit_id = std::string{ equipment_cfg::kStovetopId },
                                .start = *probe.start,
                                .end = *probe.start + s.duration,
                                .ready = *probe.start + step_blocking_span(s),
                                .burners = need.burners } };
}

slot_result equipment_allocator::place(slot_request const &request) {
  auto const key{ request.key };
  if (placement_of(key)) {
    throw std::logic_error{ "equipment_allocator::place: step is already placed" };
  }
  if (request.window_end < request.window_start) {
    return { .reason = conflict_kind::unmet_deadline };
  }

  auto const &s{ graph_.step(key) };
  auto result{ std::visit(
      match{ [&](std::monostate) -> slot_result {
              return { .placed = placement{ .key = key,
                                            .start = request.window_end,
                                            .end = request.window_end + s.duration,
                                            .ready = request.window_end +
                                                     step_blocking_span(s) } };
            },
             [&](oven_need const &need) {
               return place_oven(key, need, request.window_start, request.window_end);
             },
             [&](stovetop_need const &need) {
               return place_stovetop(key, need, request.window_start, request.window_end);
             } },
      s.equipment) };

  if (result.placed) { commit(*result.placed); }
  return result;
}

void equipment_allocator::commit(placement p) {
  auto const &chain{ graph_.chains[p.key.recipe] };
  MISE_TRACE_STEP_PLACED(chain.source->id,
                         chain.steps[p.key.step]->id,
                         p.unit_id,
                         p.start.count(),
                         p.end.count());
  auto const idx{ flat(p.key) };
  placed_[idx] = std::move(p);
}

std::optional<placement> equipment_allocator::release(step_key key) {
  auto &slot{ placed_.at(flat(key)) };
  if (!slot) { return std::nullopt; }

  auto const &chain{ graph_.chains[key.recipe] };
  MISE_TRACE_STEP_RELEASED(chain.source->id, chain.steps[key.step]->id, slot->unit_id);

  std::optional<placement> released{ std::move(slot) };
  slot.reset();
  return released;
}

void equipment_allocator::allocate() {
  std::vector<step_key> ready;
  for (std::size_t r{ 0 }; r < graph_.chains.size(); ++r) {
    if (!solution_.is_excluded(r)) { ready.push_back({ r, graph_.chain_length(r) - 1 }); }
  }

  while (!ready.empty()) {
    auto const it{ std::ranges::min_element(ready, [this](step_key a, step_key b) {
      return priority_less(a, b);
    }) };
    step_key const key{ *it };
    ready.erase(it);

    auto const &w{ solution_.window(key) };
    instant const hi{ upper_bound(key) };
    instant const lo{ w.pinned ? lower_bound(key) : hi };

    // Unpinned steps may not fall before their origin either.
    slot_request const request{ .key = key,
                                .window_start = w.pinned ? lo : std::max(lo, w.origin),
                                .window_end = hi };
    auto result{ place(request) };

    if (!result.placed) {
      auto const &chain{ graph_.chains[key.recipe] };
      MISE_TRACE_STEP_UNPLACED(chain.source->id,
                               chain.steps[key.step]->id,
                               std::string{ conflict_kind_name(result.reason) });
      tui::debug("allocate: %s/%s unplaced (%s)",
                 chain.source->id.c_str(),
                 chain.steps[key.step]->id.c_str(),
                 std::string{ conflict_kind_name(result.reason) }.c_str());
      unplaced_.push_back(unplaced_step{ .key = key,
                                         .reason = result.reason,
                                         .equipment = std::move(result.equipment),
                                         .blockers = std::move(result.blockers),
                                         .window_start = request.window_start,
                                         .window_end = request.window_end });
    }

    if (key.step > 0) { ready.push_back({ key.recipe, key.step - 1 }); }
  }

  tui::debug("allocate: %zu placed, %zu unplaced",
             static_cast<std::size_t>(std::ranges::count_if(
                 placed_,
                 [](std::optional<placement> const &p) { return p.has_value(); })),
             unplaced_.size());
}

}  // namespace mise
