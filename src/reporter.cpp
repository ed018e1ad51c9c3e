#include "reporter.h"

#include "util.h"

#include <algorithm>
#include <map>
#include <sstream>

namespace mise {

std::string_view timeline_action_name(timeline_action a) {
  switch (a) {
    case timeline_action::begin: return "begin";
    case timeline_action::end: return "end";
    case timeline_action::rest_complete: return "rest_complete";
    case timeline_action::serve: return "serve";
  }
  return "unknown";
}

namespace {

// Ends sort before begins at the same instant so a unit never looks double-booked.
int action_rank(timeline_action a) {
  switch (a) {
    case timeline_action::end: return 0;
    case timeline_action::rest_complete: return 1;
    case timeline_action::begin: return 2;
    case timeline_action::serve: return 3;
  }
  return 4;
}

assignment make_assignment(step_graph const &graph,
                           backward_solution const &solution,
                           placement const &p) {
  auto const &r{ graph.owner(p.key) };
  auto const &s{ graph.step(p.key) };

  assignment a{ .recipe_id = r.id,
                .step_id = s.id,
                .recipe_name = std::string{ r.display_name() },
                .step_name = std::string{ s.display_name() },
                .kind = p.kind,
                .equipment = p.unit_id,
                .start = p.start,
                .end = p.end,
                .ready = p.ready,
                .pinned = solution.window(p.key).pinned };
  if (p.kind == equipment_kind::oven) {
    a.rack_row = p.rack_row;
    a.temperature = p.temperature;
  } else if (p.kind == equipment_kind::stovetop) {
    a.burners = p.burners;
  }
  return a;
}

std::string begin_description(assignment const &a) {
  std::string out{ "Start " + a.step_name + " (" + a.recipe_name + ")" };
  switch (a.kind) {
    case equipment_kind::none: break;
    case equipment_kind::oven:
      out += " in " + a.equipment + " at " + std::to_string(a.temperature.value_or(0)) +
             "F, rack " + std::to_string(a.rack_row.value_or(0) + 1);
      break;
    case equipment_kind::stovetop:
      out += " on the stovetop, " + std::to_string(a.burners.value_or(0)) + " burner" +
             (a.burners.value_or(0) == 1 ? "" : "s");
      break;
  }
  return out;
}

std::vector<timeline_entry> build_timeline(std::vector<assignment> const &assignments,
                                           meal const &source) {
  std::vector<timeline_entry> out;
  for (auto const &a : assignments) {
    out.push_back({ .at = a.start,
                    .action = timeline_action::begin,
                    .recipe_id = a.recipe_id,
                    .step_id = a.step_id,
                    .equipment = a.equipment,
                    .description = begin_description(a) });
    out.push_back({ .at = a.end,
                    .action = timeline_action::end,
                    .recipe_id = a.recipe_id,
                    .step_id = a.step_id,
                    .equipment = a.equipment,
                    .description = "Finish " + a.step_name + " (" + a.recipe_name + ")" });
    if (a.ready > a.end) {
      out.push_back({ .at = a.ready,
                      .action = timeline_action::rest_complete,
                      .recipe_id = a.recipe_id,
                      .step_id = a.step_id,
                      .equipment = {},
                      .description = a.recipe_name + " has rested after " + a.step_name });
    }
  }

  out.push_back({ .at = source.meal_time,
                  .action = timeline_action::serve,
                  .recipe_id = {},
                  .step_id = {},
                  .equipment = {},
                  .description = "Serve " + (source.name.empty() ? std::string{ "the meal" }
                                                                 : source.name) });

  std::ranges::stable_sort(out, [](timeline_entry const &a, timeline_entry const &b) {
    if (a.at != b.at) { return a.at < b.at; }
    return action_rank(a.action) < action_rank(b.action);
  });
  return out;
}

// Samples `value_at` at every boundary and keeps the points where it changes.
template <typename ValueAt>
std::vector<load_change> sweep(std::vector<assignment const *> const &items,
                               ValueAt value_at) {
  std::vector<instant> bounds;
  for (auto const *a : items) {
    bounds.push_back(a->start);
    bounds.push_back(a->end);
  }
  std::ranges::sort(bounds);
  auto const dup{ std::ranges::unique(bounds) };
  bounds.erase(dup.begin(), dup.end());

  std::vector<load_change> out;
  int previous{ 0 };
  for (instant const at : bounds) {
    int const value{ value_at(at) };
    if (value != previous) { out.push_back({ .at = at, .value = value }); }
    previous = value;
  }
  return out;
}

void fill_span(unit_utilization &u, std::vector<assignment const *> const &items) {
  if (items.empty()) { return; }

  std::vector<std::pair<instant, instant>> spans;
  for (auto const *a : items) { spans.emplace_back(a->start, a->end); }
  std::ranges::sort(spans);

  u.first_start = spans.front().first;
  u.last_end = spans.front().second;
  instant run_start{ spans.front().first };
  instant run_end{ spans.front().second };
  for (auto const &[start, end] : spans) {
    u.last_end = std::max(*u.last_end, end);
    if (start > run_end) {
      u.busy += run_end - run_start;
      run_start = start;
    }
    run_end = std::max(run_end, end);
  }
  u.busy += run_end - run_start;
}

std::vector<unit_utilization> build_utilization(std::vector<assignment> const &assignments,
                                                equipment_cfg const &equipment) {
  std::vector<unit_utilization> out;

  for (auto const &oven : equipment.ovens) {
    std::vector<assignment const *> items;
    for (auto const &a : assignments) {
      if (a.kind == equipment_kind::oven && a.equipment == oven.id) { items.push_back(&a); }
    }

    unit_utilization u{ .id = oven.id, .kind = equipment_kind::oven };
    fill_span(u, items);
    u.changes = sweep(items, [&](instant at) {
      for (auto const *a : items) {
        if (a->start <= at && at < a->end) { return a->temperature.value_or(0); }
      }
      return 0;
    });

    std::optional<int> last_temperature;
    for (auto const &change : u.changes) {
      if (change.value == 0) { continue; }
      if (last_temperature && *last_temperature != change.value) { ++u.temperature_changes; }
      last_temperature = change.value;
    }
    out.push_back(std::move(u));
  }

  if (equipment.stovetop_burners > 0) {
    std::vector<assignment const *> items;
    for (auto const &a : assignments) {
      if (a.kind == equipment_kind::stovetop) { items.push_back(&a); }
    }

    unit_utilization u{ .id = std::string{ equipment_cfg::kStovetopId },
                        .kind = equipment_kind::stovetop };
    fill_span(u, items);
    u.changes = sweep(items, [&](instant at) {
      int load{ 0 };
      for (auto const *a : items) {
        if (a->start <= at && at < a->end) { load += a->burners.value_or(0); }
      }
      return load;
    });
    for (auto const &change : u.changes) {
      u.peak_burners = std::max(u.peak_burners, change.value);
    }
    out.push_back(std::move(u));
  }

  return out;
}

reported_conflict report_conflict(step_graph const &graph, conflict const &c) {
  reported_conflict out{ .kind = c.kind,
                         .status = c.status,
                         .recipe_id = graph.owner(c.key).id,
                         .step_id = graph.step(c.key).id,
                         .equipment = c.equipment,
                         .blockers = {},
                         .window_start = c.window_start,
                         .window_end = c.window_end,
                         .message = c.message };
  for (auto const &b : c.blockers) { out.blockers.push_back(graph.label(b)); }
  return out;
}

}  // namespace

schedule_checks report_checks(std::vector<reported_conflict> const &conflicts) {
  schedule_checks checks;
  for (auto const &c : conflicts) {
    checks.all_ready_by_meal_time = false;
    if (c.kind != conflict_kind::unmet_deadline) { checks.no_equipment_overbooked = false; }
  }
  return checks;
}

schedule_report report_build(report_inputs const &in) {
  schedule_report report{ .meal_name = in.source.name,
                          .meal_date = in.source.date,
                          .meal_time = in.source.meal_time,
                          .guest_count = in.source.guest_count,
                          .stages = in.stages };

  if (in.allocator) {
    for (auto const &p : in.allocator->placements()) {
      report.assignments.push_back(make_assignment(in.graph, in.solution, p));
    }
  }

  report.timeline = build_timeline(report.assignments, in.source);
  report.utilization = build_utilization(report.assignments, in.source.equipment);

  for (auto const &c : in.conflicts) {
    report.conflicts.push_back(report_conflict(in.graph, c));
  }
  report.checks = report_checks(report.conflicts);

  report.warnings = in.warnings;
  std::map<recipe_category, int> per_category;
  for (auto const &r : in.source.recipes) {
    ++per_category[r.category];
    if (r.servings < in.source.guest_count) {
      report.warnings.push_back(std::string{ r.display_name() } + " serves " +
                                std::to_string(r.servings) + ", fewer than the " +
                                std::to_string(in.source.guest_count) + " guests");
    }
  }
  for (auto const &[category, dishes] : per_category) {
    report.categories.push_back({ .category = category, .dishes = dishes });
  }

  return report;
}

std::string report_to_text(schedule_report const &report) {
  std::ostringstream oss;

  oss << (report.meal_name.empty() ? std::string{ "Meal" } : report.meal_name);
  if (report.meal_date) { oss << ", " << util_format_date(*report.meal_date, 0); }
  oss << ", served at " << util_format_instant(report.meal_time) << " for "
      << report.guest_count << " guests\n";

  if (!report.categories.empty()) {
    oss << "Dishes:";
    for (auto const &c : report.categories) {
      oss << ' ' << recipe_category_name(c.category) << '=' << c.dishes;
    }
    oss << '\n';
  }

  oss << "\nTimeline\n";
  for (auto const &e : report.timeline) {
    std::string when{ util_format_instant(e.at) };
    if (report.meal_date && util_day_index(e.at) != 0) {
      when = util_format_date(*report.meal_date, util_day_index(e.at)) + " " +
             util_format_clock(e.at);
    }
    oss << "  " << when << "  " << e.description << '\n';
  }

  oss << "\nEquipment\n";
  for (auto const &u : report.utilization) {
    oss << "  " << u.id << ": ";
    if (!u.first_start) {
      oss << "idle\n";
      continue;
    }
    oss << util_format_instant(*u.first_start) << "-" << util_format_instant(*u.last_end)
        << ", busy " << u.busy.count() << " min";
    if (u.kind == equipment_kind::oven) {
      oss << ", " << u.temperature_changes << " temperature change"
          << (u.temperature_changes == 1 ? "" : "s");
    } else {
      oss << ", peak " << u.peak_burners << " burner" << (u.peak_burners == 1 ? "" : "s");
    }
    oss << '\n';
  }

  if (!report.conflicts.empty()) {
    oss << "\nConflicts\n";
    for (auto const &c : report.conflicts) {
      oss << "  [" << conflict_kind_name(c.kind) << ", " << conflict_status_name(c.status)
          << "] " << c.message << '\n';
    }
  }

  if (!report.warnings.empty()) {
    oss << "\nWarnings\n";
    for (auto const &w : report.warnings) { oss << "  " << w << '\n'; }
  }

  oss << "\nAll dishes ready by meal time: "
      << (report.checks.all_ready_by_meal_time ? "yes" : "NO") << '\n'
      << "No equipment overbooked: " << (report.checks.no_equipment_overbooked ? "yes" : "NO")
      << '\n';
  return oss.str();
}

}  // namespace mise
