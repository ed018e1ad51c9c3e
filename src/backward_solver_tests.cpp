#include "backward_solver.h"

#include "test_support.h"

#include "doctest.h"

#include <vector>

namespace {

using mise::test::at;
using mise::test::counter_step;
using mise::test::make_recipe;
using mise::test::oven_step;

constexpr mise::instant kPrevDay{ -24 * 60 };

}  // namespace

TEST_CASE("backward_solve walks rest and hold back from meal time") {
  auto roast{ oven_step("roast", 180, 325) };
  roast.rest_time = mise::minutes{ 20 };
  roast.hold_time = mise::minutes{ 10 };
  std::vector<mise::recipe> const recipes{
    make_recipe("turkey", { counter_step("prep", 30), roast }),
  };
  auto const graph{ mise::step_graph_build(recipes) };
  auto const solution{ mise::backward_solve(graph, at("18:00"), {}) };

  CHECK(solution.unmet.empty());
  CHECK(solution.included_count() == 1);

  auto const &w_roast{ solution.window({ 0, 1 }) };
  CHECK(w_roast.latest_finish == at("17:50"));
  CHECK(w_roast.latest_start == at("14:30"));
  CHECK_FALSE(w_roast.pinned);
  CHECK_FALSE(w_roast.earliest_start);
  CHECK(w_roast.origin == at("06:00"));

  auto const &w_prep{ solution.window({ 0, 0 }) };
  CHECK(w_prep.latest_finish == at("14:30"));
  CHECK(w_prep.latest_start == at("14:00"));
}

TEST_CASE("hold on earlier steps does not delay serving") {
  auto prep{ counter_step("prep", 30) };
  prep.hold_time = mise::minutes{ 60 };
  std::vector<mise::recipe> const recipes{
    make_recipe("salad", { prep, counter_step("toss", 10) }),
  };
  auto const graph{ mise::step_graph_build(recipes) };
  auto const solution{ mise::backward_solve(graph, at("18:00"), {}) };

  CHECK(solution.window({ 0, 1 }).latest_start == at("17:50"));
  CHECK(solution.window({ 0, 0 }).latest_start == at("17:20"));
}

TEST_CASE("minutes_before_serving caps the latest start") {
  auto toss{ counter_step("toss", 10) };
  toss.minutes_before_serving = mise::minutes{ 45 };
  std::vector<mise::recipe> const recipes{ make_recipe("salad", { toss }) };
  auto const graph{ mise::step_graph_build(recipes) };
  auto const solution{ mise::backward_solve(graph, at("18:00"), {}) };

  CHECK(solution.window({ 0, 0 }).latest_start == at("17:15"));
}

TEST_CASE("a step pinned to the night before gets a window on that day") {
  auto dry{ counter_step("dry", 60) };
  dry.nights_before_serving = 1;
  std::vector<mise::recipe> const recipes{
    make_recipe("stuffing", { dry, oven_step("bake", 45, 350) }),
  };
  auto const graph{ mise::step_graph_build(recipes) };
  auto const solution{ mise::backward_solve(graph, at("18:00"), {}) };

  auto const &w{ solution.window({ 0, 0 }) };
  CHECK(w.pinned);
  CHECK(w.latest_start == kPrevDay + at("20:00"));
  REQUIRE(w.earliest_start);
  CHECK(*w.earliest_start == kPrevDay + at("06:00"));
  CHECK(w.origin == kPrevDay + at("06:00"));

  // The origin of later steps carries the earliest day used by the recipe.
  CHECK(solution.window({ 0, 1 }).origin == kPrevDay + at("06:00"));
  CHECK(solution.window({ 0, 1 }).latest_start == at("17:15"));
}

TEST_CASE("schedule options move the pinned time and the kitchen opening") {
  auto dry{ counter_step("dry", 60) };
  dry.nights_before_serving = 2;
  std::vector<mise::recipe> const recipes{ make_recipe("stuffing", { dry }) };
  auto const graph{ mise::step_graph_build(recipes) };

  mise::schedule_options const options{ .pinned_time_of_day = at("21:30"),
                                        .kitchen_opens = at("07:00"),
                                        .parallel = false };
  auto const solution{ mise::backward_solve(graph, at("18:00"), options) };

  auto const &w{ solution.window({ 0, 0 }) };
  CHECK(w.latest_start == 2 * kPrevDay + at("21:30"));
  CHECK(*w.earliest_start == 2 * kPrevDay + at("07:00"));
}

TEST_CASE("a recipe that cannot start after the kitchen opens is excluded") {
  std::vector<mise::recipe> const recipes{
    make_recipe("brisket", { counter_step("rub", 30), oven_step("smoke", 12 * 60, 225) }),
    make_recipe("rolls", { oven_step("bake", 20, 375) }),
  };
  auto const graph{ mise::step_graph_build(recipes) };
  auto const solution{ mise::backward_solve(graph, at("18:00"), {}) };

  REQUIRE(solution.unmet.size() == 1);
  CHECK(solution.is_excluded(0));
  CHECK_FALSE(solution.is_excluded(1));
  CHECK(solution.included_count() == 1);

  // The smoke starts exactly at opening; the rub before it falls short.
  auto const &u{ solution.unmet[0] };
  CHECK(u.key == mise::step_key{ 0, 0 });
  CHECK(u.latest_start == at("05:30"));
  CHECK(u.origin == at("06:00"));
}

TEST_CASE("a step exactly at the kitchen opening is still met") {
  std::vector<mise::recipe> const recipes{
    make_recipe("stock", { counter_step("simmer", 12 * 60) }),
  };
  auto const graph{ mise::step_graph_build(recipes) };
  auto const solution{ mise::backward_solve(graph, at("18:00"), {}) };

  CHECK(solution.unmet.empty());
  CHECK(solution.window({ 0, 0 }).latest_start == at("06:00"));
}

TEST_CASE("a pinned step that cannot finish its own day is unmet") {
  auto soak{ counter_step("soak", 15 * 60) };
  soak.nights_before_serving = 1;
  std::vector<mise::recipe> const recipes{ make_recipe("beans", { soak }) };
  auto const graph{ mise::step_graph_build(recipes) };
  auto const solution{ mise::backward_solve(graph, at("18:00"), {}) };

  // Latest start is 20:00 the night before, floor is 06:00 that day: still fits.
  CHECK(solution.unmet.empty());

  mise::schedule_options const late_open{ .kitchen_opens = at("21:00") };
  auto const late{ mise::backward_solve(graph, at("18:00"), late_open) };
  REQUIRE(late.unmet.size() == 1);
  CHECK(late.unmet[0].origin == kPrevDay + at("21:00"));
  CHECK(late.unmet[0].latest_start == kPrevDay + at("20:00"));
}
