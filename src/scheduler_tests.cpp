#include "scheduler.h"

#include "report_json.h"
#include "step_graph.h"
#include "test_support.h"

#include "doctest.h"

#include <algorithm>
#include <atomic>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using mise::test::at;
using mise::test::counter_step;
using mise::test::make_meal;
using mise::test::make_recipe;
using mise::test::oven_step;
using mise::test::stove_step;

mise::step_group with_max_wait(mise::step_group s, int wait) {
  s.max_wait = mise::minutes{ wait };
  return s;
}

mise::assignment const *find(mise::schedule_report const &report,
                             std::string const &recipe,
                             std::string const &step) {
  auto const it{ std::ranges::find_if(report.assignments, [&](mise::assignment const &a) {
    return a.recipe_id == recipe && a.step_id == step;
  }) };
  return it == report.assignments.end() ? nullptr : &*it;
}

mise::meal holiday_dinner() {
  auto brine{ counter_step("brine", 30) };
  brine.nights_before_serving = 1;
  auto roast{ oven_step("roast", 210, 325) };
  roast.rest_time = mise::minutes{ 30 };

  auto dry{ counter_step("dry", 45) };
  dry.nights_before_serving = 1;

  auto m{ make_meal(
      "17:30",
      {
          make_recipe("turkey", { brine, counter_step("prep", 30), roast }),
          make_recipe("stuffing", { dry, oven_step("bake", 45, 350, 2, mise::rack_width::half) },
                      mise::recipe_category::starch),
          make_recipe("potatoes",
                      { stove_step("boil", 25, 2), counter_step("mash", 10) },
                      mise::recipe_category::starch),
          make_recipe("green-beans",
                      { stove_step("blanch", 8, 1), oven_step("casserole", 30, 350, 2,
                                                               mise::rack_width::half) },
                      mise::recipe_category::vegetable),
          make_recipe("gravy", { stove_step("simmer", 20, 1) }),
          make_recipe("rolls", { with_max_wait(oven_step("bake", 15, 375), 120) },
                      mise::recipe_category::bread),
          make_recipe("pie", { oven_step("bake", 55, 375) }, mise::recipe_category::dessert),
      }) };
  m.equipment.ovens.push_back(
      mise::oven_unit{ .id = "oven-2", .physical_racks = 2, .rack_positions = 5 });
  return m;
}

}  // namespace

TEST_CASE("a single recipe with rest and hold lands as late as possible") {
  auto roast{ oven_step("roast", 180, 325) };
  roast.rest_time = mise::minutes{ 20 };
  roast.hold_time = mise::minutes{ 10 };
  auto const report{ mise::schedule_meal(
      make_meal("18:00", { make_recipe("turkey", { counter_step("prep", 30), roast }) })) };

  CHECK_FALSE(report.has_conflicts());
  CHECK(report.stages == std::vector<mise::run_stage>{ mise::run_stage::building,
                                                      mise::run_stage::backward_solved,
                                                      mise::run_stage::allocated,
                                                      mise::run_stage::resolved,
                                                      mise::run_stage::reported });

  auto const *r{ find(report, "turkey", "roast") };
  REQUIRE(r != nullptr);
  CHECK(r->start == at("14:30"));
  CHECK(r->end == at("17:30"));

  auto const *p{ find(report, "turkey", "prep") };
  REQUIRE(p != nullptr);
  CHECK(p->start == at("14:00"));
  CHECK(p->end == at("14:30"));
}

TEST_CASE("a rigid roast blocks rolls that may only wait half an hour") {
  auto const report{ mise::schedule_meal(make_meal(
      "18:00",
      { make_recipe("roast", { with_max_wait(oven_step("bake", 60, 325), 0) }),
        make_recipe("rolls", { with_max_wait(oven_step("bake", 20, 375), 30) }) })) };

  CHECK(report.stages[3] == mise::run_stage::conflicts_remain);
  REQUIRE(report.conflicts.size() == 1);
  auto const &c{ report.conflicts[0] };
  CHECK(c.kind == mise::conflict_kind::equipment_overbooked);
  CHECK(c.status == mise::conflict_status::unresolved);
  CHECK(c.recipe_id == "rolls");
  CHECK(c.equipment == "oven-1");
  CHECK(c.blockers == std::vector<std::string>{ "roast/bake" });
  CHECK(c.message.find("roast/bake") != std::string::npos);
  CHECK(c.message.find("rolls/bake") != std::string::npos);
  CHECK_FALSE(report.checks.no_equipment_overbooked);
}

TEST_CASE("rolls that may wait longer bake before the roast") {
  auto const report{ mise::schedule_meal(make_meal(
      "18:00",
      { make_recipe("roast", { with_max_wait(oven_step("bake", 60, 325), 0) }),
        make_recipe("rolls", { with_max_wait(oven_step("bake", 20, 375), 90) }) })) };

  CHECK_FALSE(report.has_conflicts());
  CHECK(report.stages[3] == mise::run_stage::resolved);
  auto const *rolls{ find(report, "rolls", "bake") };
  REQUIRE(rolls != nullptr);
  CHECK(rolls->start == at("16:40"));
  REQUIRE(report.warnings.size() == 1);
  CHECK(report.warnings[0].find("60 min earlier") != std::string::npos);
}

TEST_CASE("a step pinned to the night before runs that evening") {
  auto dry{ counter_step("dry", 60) };
  dry.nights_before_serving = 1;
  auto const report{ mise::schedule_meal(
      make_meal("18:00", { make_recipe("stuffing", { dry, oven_step("bake", 45, 350) }) })) };

  CHECK_FALSE(report.has_conflicts());
  auto const *a{ find(report, "stuffing", "dry") };
  REQUIRE(a != nullptr);
  CHECK(a->pinned);
  CHECK(mise::util_day_index(a->start) == -1);
  CHECK(mise::util_time_of_day(a->start) <= at("20:00"));
  CHECK(mise::util_time_of_day(a->start) >= at("06:00"));
}

TEST_CASE("a dessert that cannot wait is reported as unresolved") {
  auto const report{ mise::schedule_meal(make_meal(
      "18:00",
      { make_recipe("roast", { with_max_wait(oven_step("bake", 90, 325), 0) }),
        make_recipe("pie",
                    { with_max_wait(oven_step("bake", 50, 375), 0) },
                    mise::recipe_category::dessert) })) };

  REQUIRE(report.conflicts.size() == 1);
  CHECK(report.conflicts[0].recipe_id == "pie");
  CHECK(report.conflicts[0].status == mise::conflict_status::unresolved);
  CHECK(find(report, "pie", "bake") == nullptr);
  CHECK(find(report, "roast", "bake") != nullptr);
}

TEST_CASE("a full holiday dinner keeps every invariant") {
  auto const input{ holiday_dinner() };
  auto const report{ mise::schedule_meal(input) };

  // Every step is placed; stuffing and the casserole are repaired onto oven-2.
  CHECK(report.assignments.size() == 12);
  CHECK(report.conflicts.empty());
  CHECK(report.checks.all_ready_by_meal_time);
  CHECK(report.checks.no_equipment_overbooked);
  CHECK(report.warnings == std::vector<std::string>{
                               "stuffing/bake starts 55 min earlier than ideal, at 15:50",
                               "green-beans/casserole starts 55 min earlier than ideal, at "
                               "16:05; green-beans/blanch moved 55 min earlier to 15:57",
                           });

  // Chains stay ordered, including rest.
  for (auto const &r : input.recipes) {
    for (std::size_t i{ 1 }; i < r.steps.size(); ++i) {
      auto const *prev{ find(report, r.id, r.steps[i - 1].id) };
      auto const *next{ find(report, r.id, r.steps[i].id) };
      REQUIRE_MESSAGE(prev != nullptr, r.id << ": " << r.steps[i - 1].id);
      REQUIRE_MESSAGE(next != nullptr, r.id << ": " << r.steps[i].id);
      CHECK_MESSAGE(prev->ready <= next->start, r.id << ": " << r.steps[i].id);
    }
  }

  // No step starts before the kitchen opens on its day.
  for (auto const &a : report.assignments) {
    CHECK_MESSAGE(mise::util_time_of_day(a.start) >= at("06:00"), a.recipe_id << "/"
                                                                               << a.step_id);
  }

  // Every placed dish is ready by meal time.
  for (auto const &a : report.assignments) {
    CHECK(a.end <= input.meal_time);
  }

  // One temperature per oven at a time; only half-width dishes share a row.
  auto const is_half{ [](mise::assignment const &a) {
    return a.recipe_id == "stuffing" || a.step_id == "casserole";
  } };
  for (auto const &a : report.assignments) {
    for (auto const &b : report.assignments) {
      if (&a == &b || a.kind != mise::equipment_kind::oven || a.equipment != b.equipment) {
        continue;
      }
      bool const overlap{ a.start < b.end && b.start < a.end };
      if (!overlap) { continue; }
      CHECK(a.temperature == b.temperature);
      if (a.rack_row == b.rack_row) {
        CHECK(is_half(a));
        CHECK(is_half(b));
      }
    }
  }

  // Burner load never exceeds the stovetop.
  std::map<mise::instant, int> load;
  for (auto const &a : report.assignments) {
    if (a.kind != mise::equipment_kind::stovetop) { continue; }
    for (auto t{ a.start }; t < a.end; t += mise::minutes{ 1 }) { load[t] += *a.burners; }
  }
  for (auto const &[t, burners] : load) {
    CHECK(burners <= input.equipment.stovetop_burners);
  }

  // Both night-before steps are pinned to the evening before.
  CHECK(mise::util_day_index(find(report, "turkey", "brine")->start) == -1);
  CHECK(mise::util_day_index(find(report, "stuffing", "dry")->start) == -1);
}

TEST_CASE("a repair never reports a chain that starts before the kitchen opens") {
  auto const report{ mise::schedule_meal(make_meal(
      "18:00",
      { make_recipe("roast", { with_max_wait(oven_step("bake", 690, 325), 0) }),
        make_recipe("rolls", { counter_step("prep", 30), oven_step("bake", 30, 375) }) })) };

  REQUIRE(report.conflicts.size() == 1);
  CHECK(report.conflicts[0].recipe_id == "rolls");
  CHECK(report.conflicts[0].kind == mise::conflict_kind::equipment_overbooked);
  CHECK_FALSE(report.checks.all_ready_by_meal_time);
  CHECK_FALSE(report.checks.no_equipment_overbooked);
  CHECK(report.warnings.empty());

  for (auto const &a : report.assignments) {
    CHECK_MESSAGE(a.start >= at("06:00"), a.recipe_id << "/" << a.step_id);
  }
  CHECK(find(report, "rolls", "bake") == nullptr);
}

TEST_CASE("a night-before chain blocked in the oven reports the oven") {
  auto soak{ counter_step("soak", 30) };
  soak.nights_before_serving = 1;
  auto dry{ counter_step("dry", 840) };
  dry.nights_before_serving = 1;

  auto const report{ mise::schedule_meal(make_meal(
      "18:00",
      { make_recipe("ham", { soak, with_max_wait(oven_step("bake", 1400, 325), 0) }),
        make_recipe("stuffing", { dry, oven_step("bake", 45, 375) }) })) };

  REQUIRE(report.conflicts.size() == 1);
  auto const &c{ report.conflicts[0] };
  CHECK(c.kind == mise::conflict_kind::equipment_overbooked);
  CHECK(c.equipment == "oven-1");
  CHECK(c.blockers == std::vector<std::string>{ "ham/bake" });
  CHECK_FALSE(report.checks.no_equipment_overbooked);
}

TEST_CASE("scheduling is deterministic and leaves the input untouched") {
  auto const input{ holiday_dinner() };
  auto const copy{ input };

  auto const first{ mise::report_to_json(mise::schedule_meal(input)) };
  auto const second{ mise::report_to_json(mise::schedule_meal(input)) };
  CHECK(first == second);

  auto sequential{ input };
  sequential.options.parallel = false;
  CHECK(mise::report_to_json(mise::schedule_meal(sequential)) == first);

  REQUIRE(copy.recipes.size() == input.recipes.size());
  for (std::size_t i{ 0 }; i < input.recipes.size(); ++i) {
    CHECK(copy.recipes[i].id == input.recipes[i].id);
    CHECK(copy.recipes[i].steps.size() == input.recipes[i].steps.size());
  }
}

TEST_CASE("a meal where nothing fits stops after the backward pass") {
  auto const report{ mise::schedule_meal(make_meal(
      "08:00",
      { make_recipe("brisket", { oven_step("smoke", 12 * 60, 225) }),
        make_recipe("stock", { counter_step("simmer", 6 * 60) }) })) };

  CHECK(report.stages == std::vector<mise::run_stage>{ mise::run_stage::building,
                                                      mise::run_stage::backward_solved,
                                                      mise::run_stage::unmet_deadline,
                                                      mise::run_stage::reported });
  REQUIRE(report.conflicts.size() == 2);
  for (auto const &c : report.conflicts) {
    CHECK(c.kind == mise::conflict_kind::unmet_deadline);
    CHECK(c.status == mise::conflict_status::fatal);
  }
  CHECK(report.assignments.empty());
  CHECK_FALSE(report.checks.all_ready_by_meal_time);
  CHECK(report.checks.no_equipment_overbooked);
}

TEST_CASE("a partially unmet meal still schedules the rest") {
  auto const report{ mise::schedule_meal(
      make_meal("18:00",
                { make_recipe("brisket", { oven_step("smoke", 13 * 60, 225) }),
                  make_recipe("rolls", { oven_step("bake", 20, 375) }) })) };

  CHECK(report.stages[2] == mise::run_stage::allocated);
  CHECK(report.stages[3] == mise::run_stage::conflicts_remain);
  REQUIRE(report.conflicts.size() == 1);
  CHECK(report.conflicts[0].status == mise::conflict_status::fatal);
  CHECK(find(report, "rolls", "bake") != nullptr);
  CHECK(find(report, "brisket", "smoke") == nullptr);
}

TEST_CASE("schedule_meal honours a cancel flag") {
  std::atomic_bool cancel{ true };
  auto const m{ make_meal("18:00", { make_recipe("salad", { counter_step("toss", 10) }) }) };

  try {
    static_cast<void>(mise::schedule_meal(m, { .cancel = &cancel }));
    FAIL("expected schedule_cancelled");
  } catch (mise::schedule_cancelled const &e) {
    CHECK(e.stage() == mise::run_stage::building);
    CHECK(std::string(e.what()) == "scheduling cancelled before stage 'building'");
  }

  cancel = false;
  CHECK_NOTHROW(static_cast<void>(mise::schedule_meal(m, { .cancel = &cancel })));
}

TEST_CASE("schedule_meal rejects malformed input") {
  SUBCASE("malformed recipe") {
    auto const m{ make_meal("18:00", { make_recipe("empty", {}) }) };
    CHECK_THROWS_AS(mise::schedule_meal(m), mise::malformed_recipe);
  }

  SUBCASE("bad equipment") {
    auto m{ make_meal("18:00", { make_recipe("salad", { counter_step("toss", 10) }) }) };
    m.equipment.ovens[0].physical_racks = 0;
    CHECK_THROWS_AS(mise::schedule_meal(m), std::runtime_error);
  }
}

TEST_CASE("an empty meal is reported without conflicts") {
  auto const report{ mise::schedule_meal(make_meal("18:00", {})) };
  CHECK_FALSE(report.has_conflicts());
  CHECK(report.assignments.empty());
  REQUIRE(report.timeline.size() == 1);
  CHECK(report.timeline[0].action == mise::timeline_action::serve);
}
