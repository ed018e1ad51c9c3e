#include "allocator.h"

#include "test_support.h"

#include "doctest.h"

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

using mise::test::at;
using mise::test::counter_step;
using mise::test::make_recipe;
using mise::test::oven_step;
using mise::test::stove_step;

struct allocation {
  std::vector<mise::recipe> recipes;
  mise::equipment_cfg equipment;
  mise::schedule_options options;
  mise::step_graph graph;
  mise::backward_solution solution;
  std::unique_ptr<mise::equipment_allocator> allocator;

  explicit allocation(std::vector<mise::recipe> r,
                      mise::equipment_cfg e = mise::equipment_cfg::defaults(),
                      bool run_allocate = true)
      : recipes{ std::move(r) }, equipment{ std::move(e) } {
    graph = mise::step_graph_build(recipes);
    solution = mise::backward_solve(graph, at("18:00"), options);
    allocator =
        std::make_unique<mise::equipment_allocator>(graph, solution, equipment, options);
    if (run_allocate) { allocator->allocate(); }
  }

  mise::placement const &placed(std::size_t r, std::size_t s) const {
    auto const *p{ allocator->placement_of({ r, s }) };
    REQUIRE(p != nullptr);
    return *p;
  }
};

mise::equipment_cfg two_ovens() {
  auto cfg{ mise::equipment_cfg::defaults() };
  cfg.ovens.push_back(
      mise::oven_unit{ .id = "oven-2", .physical_racks = 2, .rack_positions = 5 });
  return cfg;
}

mise::step_group with_max_wait(mise::step_group s, int wait) {
  s.max_wait = mise::minutes{ wait };
  return s;
}

mise::step_group with_hold(mise::step_group s, int hold) {
  s.hold_time = mise::minutes{ hold };
  return s;
}

}  // namespace

TEST_CASE("allocate places a chain as late as it can") {
  auto roast{ oven_step("roast", 180, 325) };
  roast.rest_time = mise::minutes{ 20 };
  roast.hold_time = mise::minutes{ 10 };
  allocation const a{ { make_recipe("turkey", { counter_step("prep", 30), roast }) } };

  auto const &r{ a.placed(0, 1) };
  CHECK(r.kind == mise::equipment_kind::oven);
  CHECK(r.unit_id == "oven-1");
  CHECK(r.start == at("14:30"));
  CHECK(r.end == at("17:30"));
  CHECK(r.ready == at("17:50"));
  CHECK(r.rack_row == 0);
  CHECK(r.temperature == 325);

  auto const &p{ a.placed(0, 0) };
  CHECK(p.kind == mise::equipment_kind::none);
  CHECK(p.unit_id.empty());
  CHECK(p.start == at("14:00"));
  CHECK(p.end == at("14:30"));

  CHECK(a.allocator->unplaced().empty());

  auto const all{ a.allocator->placements() };
  REQUIRE(all.size() == 2);
  CHECK(all[0].key == mise::step_key{ 0, 0 });
  CHECK(all[1].key == mise::step_key{ 0, 1 });
}

TEST_CASE("full-width steps take separate rows") {
  allocation const a{ {
      make_recipe("a", { oven_step("bake", 60, 325) }),
      make_recipe("b", { oven_step("bake", 60, 325) }),
      make_recipe("c", { oven_step("bake", 60, 325) }),
  } };

  CHECK(a.placed(0, 0).rack_row == 0);
  CHECK(a.placed(1, 0).rack_row == 1);

  REQUIRE(a.allocator->unplaced().size() == 1);
  auto const &u{ a.allocator->unplaced()[0] };
  CHECK(u.key == mise::step_key{ 2, 0 });
  CHECK(u.reason == mise::conflict_kind::insufficient_rack_space);
  CHECK(u.equipment == "oven-1");
  CHECK(u.blockers == std::vector<mise::step_key>{ { 0, 0 }, { 1, 0 } });
  CHECK(u.window_start == at("17:00"));
  CHECK(u.window_end == at("17:00"));
}

TEST_CASE("half-width steps share a row up to two and within its positions") {
  auto const half{ [](char const *id, int height) {
    return oven_step(id, 60, 350, height, mise::rack_width::half);
  } };

  SUBCASE("two halves share, a third moves down a row") {
    allocation const a{ {
        make_recipe("a", { half("bake", 2) }),
        make_recipe("b", { half("bake", 2) }),
        make_recipe("c", { half("bake", 1) }),
    } };
    CHECK(a.placed(0, 0).rack_row == 0);
    CHECK(a.placed(1, 0).rack_row == 0);
    CHECK(a.placed(2, 0).rack_row == 1);
  }

  SUBCASE("combined height must fit the rack positions") {
    allocation const a{ {
        make_recipe("a", { half("bake", 3) }),
        make_recipe("b", { half("bake", 3) }),
    } };
    CHECK(a.placed(0, 0).rack_row == 0);
    CHECK(a.placed(1, 0).rack_row == 1);
  }

  SUBCASE("a half never joins a row holding a full") {
    allocation const a{ {
        make_recipe("a", { oven_step("bake", 60, 350) }),
        make_recipe("b", { half("bake", 1) }),
    } };
    CHECK(a.placed(0, 0).rack_row == 0);
    CHECK(a.placed(1, 0).rack_row == 1);
    CHECK(a.placed(1, 0).width == mise::rack_width::half);
  }

  SUBCASE("a step taller than the rack does not fit anywhere") {
    allocation const a{ { make_recipe("a", { half("bake", 6) }) } };
    REQUIRE(a.allocator->unplaced().size() == 1);
    CHECK(a.allocator->unplaced()[0].reason == mise::conflict_kind::insufficient_rack_space);
  }
}

TEST_CASE("an oven holds one temperature at a time") {
  allocation const a{ {
      make_recipe("roast", { with_max_wait(oven_step("bake", 60, 325), 0) }),
      make_recipe("rolls", { with_max_wait(oven_step("bake", 20, 375), 30) }),
  } };

  auto const &roast{ a.placed(0, 0) };
  CHECK(roast.start == at("17:00"));
  CHECK(a.allocator->placement_of({ 1, 0 }) == nullptr);

  REQUIRE(a.allocator->unplaced().size() == 1);
  auto const &u{ a.allocator->unplaced()[0] };
  CHECK(u.reason == mise::conflict_kind::equipment_overbooked);
  CHECK(u.equipment == "oven-1");
  CHECK(u.blockers == std::vector<mise::step_key>{ { 0, 0 } });
}

TEST_CASE("the least flexible step is placed first") {
  // Rolls come first in the input but may wait indefinitely.
  allocation const a{ {
      make_recipe("rolls", { oven_step("bake", 20, 375) }),
      make_recipe("roast", { with_max_wait(oven_step("bake", 60, 325), 0) }),
  } };

  CHECK(a.placed(1, 0).start == at("17:00"));
  REQUIRE(a.allocator->unplaced().size() == 1);
  CHECK(a.allocator->unplaced()[0].key == mise::step_key{ 0, 0 });
}

TEST_CASE("a second oven takes a clashing temperature") {
  allocation const a{ {
                          make_recipe("roast", { oven_step("bake", 60, 325) }),
                          make_recipe("rolls", { oven_step("bake", 20, 375) }),
                      },
                      two_ovens() };

  CHECK(a.placed(0, 0).unit_id == "oven-1");
  CHECK(a.placed(1, 0).unit_id == "oven-2");
  CHECK(a.placed(1, 0).unit_index == 1);
  CHECK(a.placed(1, 0).start == at("17:40"));
  CHECK(a.allocator->unplaced().empty());
}

TEST_CASE("equal starts prefer the unit already hosting the temperature partition") {
  allocation const a{ {
                          make_recipe("glaze", { with_max_wait(oven_step("set", 20, 325), 0) }),
                          make_recipe("ham", { with_max_wait(oven_step("bake", 60, 350), 5) }),
                          make_recipe("beans",
                                      { with_hold(with_max_wait(oven_step("bake", 30, 350), 10),
                                                  40) }),
                      },
                      two_ovens() };

  CHECK(a.placed(0, 0).unit_id == "oven-1");
  CHECK(a.placed(1, 0).unit_id == "oven-2");

  auto const &beans{ a.placed(2, 0) };
  CHECK(beans.start == at("16:50"));
  CHECK(beans.unit_id == "oven-2");
  CHECK(beans.rack_row == 1);

  auto const &partitions{ a.allocator->partitions() };
  REQUIRE(partitions.size() == 2);
  CHECK(partitions[0].temperature == 325);
  CHECK(partitions[1].temperature == 350);
  CHECK(partitions[1].steps.size() == 2);
}

TEST_CASE("the sequential path matches the parallel unit probe") {
  allocation a{ {
                    make_recipe("roast", { oven_step("bake", 60, 325) }),
                    make_recipe("rolls", { oven_step("bake", 20, 375) }),
                },
                two_ovens(),
                false };
  a.options.parallel = false;
  a.allocator->allocate();

  CHECK(a.placed(1, 0).unit_id == "oven-2");
}

TEST_CASE("burner load may not exceed the stovetop") {
  allocation const a{ {
      make_recipe("gravy", { stove_step("simmer", 30, 3) }),
      make_recipe("potatoes", { stove_step("boil", 30, 2) }),
      make_recipe("peas", { stove_step("warm", 30, 1) }),
  } };

  CHECK(a.placed(0, 0).burners == 3);
  CHECK(a.placed(0, 0).unit_id == "stovetop");
  CHECK(a.placed(2, 0).start == at("17:30"));

  REQUIRE(a.allocator->unplaced().size() == 1);
  auto const &u{ a.allocator->unplaced()[0] };
  CHECK(u.key == mise::step_key{ 1, 0 });
  CHECK(u.reason == mise::conflict_kind::burner_overbooked);
  CHECK(u.equipment == "stovetop");
  CHECK(u.blockers == std::vector<mise::step_key>{ { 0, 0 } });
}

TEST_CASE("counter work never contends") {
  allocation const a{ {
      make_recipe("salad", { counter_step("toss", 10) }),
      make_recipe("slaw", { counter_step("toss", 10) }),
  } };
  CHECK(a.placed(0, 0).start == at("17:50"));
  CHECK(a.placed(1, 0).start == at("17:50"));
}

TEST_CASE("excluded recipes are not allocated") {
  allocation const a{ {
      make_recipe("brisket", { oven_step("smoke", 13 * 60, 225) }),
      make_recipe("rolls", { oven_step("bake", 20, 375) }),
  } };
  CHECK(a.allocator->placement_of({ 0, 0 }) == nullptr);
  CHECK(a.allocator->unplaced().empty());
  CHECK(a.placed(1, 0).start == at("17:40"));
}

TEST_CASE("place picks the latest start that clears placed steps") {
  allocation const a{ {
      make_recipe("roast", { with_max_wait(oven_step("bake", 60, 325), 0) }),
      make_recipe("rolls", { oven_step("bake", 20, 375) }),
  } };
  REQUIRE(a.allocator->placement_of({ 1, 0 }) == nullptr);

  auto const result{ a.allocator->place(
      { .key = { 1, 0 }, .window_start = at("16:10"), .window_end = at("17:40") }) };
  REQUIRE(result.placed);
  CHECK(result.placed->start == at("16:40"));
  CHECK(result.placed->end == at("17:00"));
  CHECK(a.allocator->placement_of({ 1, 0 }) != nullptr);

  CHECK_THROWS_AS(a.allocator->place({ .key = { 1, 0 },
                                       .window_start = at("16:10"),
                                       .window_end = at("17:40") }),
                  std::logic_error);
}

TEST_CASE("place reports an empty window as an unmet deadline") {
  allocation const a{ { make_recipe("salad", { counter_step("toss", 10) }) }, {}, false };
  auto const result{ a.allocator->place(
      { .key = { 0, 0 }, .window_start = at("17:00"), .window_end = at("16:00") }) };
  CHECK_FALSE(result.placed);
  CHECK(result.reason == mise::conflict_kind::unmet_deadline);
}

TEST_CASE("an oven step with no oven is overbooked") {
  allocation const a{ { make_recipe("rolls", { oven_step("bake", 20, 375) }) },
                      mise::equipment_cfg{ .ovens = {}, .stovetop_burners = 4 } };
  REQUIRE(a.allocator->unplaced().size() == 1);
  CHECK(a.allocator->unplaced()[0].reason == mise::conflict_kind::equipment_overbooked);
  CHECK(a.allocator->unplaced()[0].equipment.empty());
}

TEST_CASE("release, snapshot and restore round the ledger") {
  allocation const a{ { make_recipe("rolls", { oven_step("bake", 20, 375) }) } };

  auto const saved{ a.allocator->snapshot() };
  auto const released{ a.allocator->release({ 0, 0 }) };
  REQUIRE(released);
  CHECK(released->start == at("17:40"));
  CHECK(a.allocator->placement_of({ 0, 0 }) == nullptr);
  CHECK_FALSE(a.allocator->release({ 0, 0 }));

  a.allocator->restore(saved);
  REQUIRE(a.allocator->placement_of({ 0, 0 }) != nullptr);
  CHECK(a.allocator->placement_of({ 0, 0 })->start == at("17:40"));

  CHECK_THROWS_AS(a.allocator->restore({}), std::logic_error);
}

TEST_CASE("upper_bound follows the placed successor") {
  allocation const a{ { make_recipe("pie",
                                    { counter_step("crust", 30),
                                      oven_step("bake", 50, 375) }) } };
  CHECK(a.allocator->upper_bound({ 0, 1 }) == at("17:10"));
  CHECK(a.allocator->upper_bound({ 0, 0 }) == at("16:40"));
  CHECK(a.allocator->lower_bound({ 0, 0 }) == at("06:00"));
  CHECK(a.allocator->chain_lower_bound({ 0, 0 }) == at("06:00"));
  CHECK(a.allocator->chain_lower_bound({ 0, 1 }) == at("06:30"));

  a.allocator->release({ 0, 1 });
  static_cast<void>(a.allocator->place(
      { .key = { 0, 1 }, .window_start = at("15:00"), .window_end = at("16:00") }));
  CHECK(a.allocator->upper_bound({ 0, 0 }) == at("15:30"));
}
