#include "conflict_resolver.h"

#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

namespace mise {

std::optional<repair_window> shift_earlier_strategy::propose(repair_context const &ctx) const {
  instant start{ ctx.lower_bound };
  if (ctx.step.max_wait) { start = std::max(start, ctx.upper_bound - *ctx.step.max_wait); }
  if (start > ctx.upper_bound) { return std::nullopt; }
  return repair_window{ .start = start, .end = ctx.upper_bound };
}

namespace {

void merge_into(std::vector<step_key> &into, std::vector<step_key> const &from) {
  into.insert(into.end(), from.begin(), from.end());
  std::ranges::sort(into);
  auto const dup{ std::ranges::unique(into) };
  into.erase(dup.begin(), dup.end());
}

conflict make_conflict(step_graph const &graph,
                       step_key key,
                       conflict_kind kind,
                       std::string equipment,
                       std::vector<step_key> blockers,
                       instant window_start,
                       instant window_end) {
  conflict c{ .kind = kind,
              .status = conflict_status::unresolved,
              .key = key,
              .equipment = std::move(equipment),
              .blockers = std::move(blockers),
              .window_start = window_start,
              .window_end = window_end,
              .message = {} };
  c.message = conflict_describe(c, graph);
  return c;
}

struct cascade_failure {
  step_key key;
  slot_result result;
};

// Re-places placed predecessors of `key` whose ready time overruns `start`.
std::optional<cascade_failure> shift_predecessors(equipment_allocator &allocator,
                                                  step_key key,
                                                  instant start,
                                                  std::vector<std::string> &notes) {
  auto const &graph{ allocator.graph() };
  auto const &solution{ allocator.solution() };

  while (key.step > 0) {
    step_key const prev{ key.recipe, key.step - 1 };
    auto const *placed{ allocator.placement_of(prev) };
    if (!placed || placed->ready <= start) { return std::nullopt; }

    auto const &w{ solution.window(prev) };
    instant const hi{ std::min(w.latest_start,
                               start - step_blocking_span(graph.step(prev))) };
    instant const opening{ allocator.lower_bound(prev) };
    instant const lo{ w.pinned ? opening : hi };
    instant const old_start{ placed->start };

    // Moving past the origin would put the step before the kitchen opens.
    if (hi < opening) {
      return cascade_failure{ .key = prev,
                              .result = { .reason = conflict_kind::unmet_deadline } };
    }

    allocator.release(prev);
    auto result{ allocator.place({ .key = prev, .window_start = lo, .window_end = hi }) };
    if (!result.placed) {
      return cascade_failure{ .key = prev, .result = std::move(result) };
    }

    notes.push_back(graph.label(prev) + " moved " +
                    std::to_string((old_start - result.placed->start).count()) +
                    " min earlier to " + util_format_instant(result.placed->start));
    start = result.placed->start;
    key = prev;
  }
  return std::nullopt;
}

}  // namespace

resolution conflict_resolve(equipment_allocator &allocator, repair_strategy const &strategy) {
  auto const &graph{ allocator.graph() };
  auto const &solution{ allocator.solution() };
  resolution out;

  for (auto const &item : allocator.unplaced()) {
    auto const key{ item.key };
    auto const &chain{ graph.chains[key.recipe] };
    auto const &step{ graph.step(key) };

    repair_context const ctx{ .key = key,
                              .step = step,
                              .window = solution.window(key),
                              .lower_bound = allocator.chain_lower_bound(key),
                              .upper_bound = allocator.upper_bound(key) };

    auto const proposal{ strategy.propose(ctx) };
    if (!proposal) {
      MISE_TRACE_REPAIR_COMPLETE(chain.source->id, step.id, false, std::int64_t{ 0 });
      out.conflicts.push_back(make_conflict(graph,
                                            key,
                                            item.reason,
                                            item.equipment,
                                            item.blockers,
                                            item.window_start,
                                            item.window_end));
      continue;
    }

    MISE_TRACE_REPAIR_ATTEMPT(chain.source->id,
                              step.id,
                              std::string{ strategy.name() },
                              proposal->start.count(),
                              proposal->end.count());

    auto saved{ allocator.snapshot() };
    auto result{ allocator.place(
        { .key = key, .window_start = proposal->start, .window_end = proposal->end }) };

    if (!result.placed) {
      MISE_TRACE_REPAIR_COMPLETE(chain.source->id, step.id, false, std::int64_t{ 0 });
      // Keep the first-pass blockers: they overlap the ideal slot.
      merge_into(result.blockers, item.blockers);
      out.conflicts.push_back(make_conflict(graph,
                                            key,
                                            result.reason,
                                            std::move(result.equipment),
                                            std::move(result.blockers),
                                            proposal->start,
                                            proposal->end));
      continue;
    }

    std::vector<std::string> notes;
    if (auto failure{ shift_predecessors(allocator, key, result.placed->start, notes) }) {
      allocator.restore(std::move(saved));
      MISE_TRACE_REPAIR_COMPLETE(chain.source->id, step.id, false, std::int64_t{ 0 });

      // The step itself still clashes at its ideal slot; report that, naming the
      // predecessor that could not make room and whatever held it.
      auto blockers{ item.blockers };
      merge_into(blockers, failure->result.blockers);
      merge_into(blockers, { failure->key });
      out.conflicts.push_back(make_conflict(graph,
                                            key,
                                            item.reason,
                                            item.equipment,
                                            std::move(blockers),
                                            item.window_start,
                                            item.window_end));
      out.conflicts.back().message +=
          "; moving it earlier would need " + graph.label(failure->key) + " to move too";
      continue;
    }

    auto const shift{ ctx.upper_bound - result.placed->start };
    MISE_TRACE_REPAIR_COMPLETE(chain.source->id, step.id, true, shift.count());
    ++out.repaired;

    std::string warning{ graph.label(key) + " starts " + std::to_string(shift.count()) +
                         " min earlier than ideal, at " +
                         util_format_instant(result.placed->start) };
    if (step.max_wait) {
      warning += " (waits " + std::to_string(shift.count()) + " of " +
                 std::to_string(step.max_wait->count()) + " min allowed)";
    }
    for (auto const &note : notes) { warning += "; " + note; }
    tui::info("%s", warning.c_str());
    out.warnings.push_back(std::move(warning));
  }

  return out;
}

std::vector<conflict> conflict_from_unmet(step_graph const &graph,
                                          backward_solution const &solution) {
  std::vector<conflict> out;
  out.reserve(solution.unmet.size());
  for (auto const &u : solution.unmet) {
    conflict c{ .kind = conflict_kind::unmet_deadline,
                .status = conflict_status::fatal,
                .key = u.key,
                .equipment = {},
                .blockers = {},
                .window_start = u.origin,
                .window_end = u.latest_start,
                .message = {} };
    c.message = conflict_describe(c, graph);
    out.push_back(std::move(c));
  }
  return out;
}

}  // namespace mise
