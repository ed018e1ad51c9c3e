#include "step_graph.h"

#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <limits>
#include <unordered_set>
#include <utility>

namespace mise {

malformed_recipe::malformed_recipe(std::string recipe_id, std::string const &message)
    : std::runtime_error{ "malformed recipe '" + recipe_id + "': " + message },
      recipe_id_{ std::move(recipe_id) } {}

step_group const &step_graph::step(step_key key) const {
  return *chains.at(key.recipe).steps.at(key.step);
}

recipe const &step_graph::owner(step_key key) const { return *chains.at(key.recipe).source; }

std::size_t step_graph::chain_length(std::size_t recipe_index) const {
  return chains.at(recipe_index).steps.size();
}

std::size_t step_graph::step_count() const {
  std::size_t total{ 0 };
  for (auto const &chain : chains) { total += chain.steps.size(); }
  return total;
}

std::size_t step_graph::input_order(step_key key) const {
  return chains.at(key.recipe).first_input_order + key.step;
}

bool step_graph::is_last(step_key key) const {
  return key.step + 1 == chain_length(key.recipe);
}

std::string step_graph::label(step_key key) const {
  return owner(key).id + "/" + step(key).id;
}

namespace {

void validate_step(recipe const &r, step_group const &s) {
  auto const fail{ [&](std::string const &what) {
    throw malformed_recipe(r.id, "step '" + s.id + "' " + what);
  } };

  if (s.duration < minutes{ 0 }) { fail("has a negative duration"); }
  if (s.rest_time < minutes{ 0 }) { fail("has a negative rest time"); }
  if (s.hold_time < minutes{ 0 }) { fail("has a negative hold time"); }
  if (s.max_wait && *s.max_wait < minutes{ 0 }) { fail("has a negative max wait"); }
  if (s.nights_before_serving && *s.nights_before_serving < 0) {
    fail("has a negative nights_before_serving");
  }
  if (s.minutes_before_serving && *s.minutes_before_serving < minutes{ 0 }) {
    fail("has a negative minutes_before_serving");
  }
  if (s.nights_before_serving && *s.nights_before_serving > 0 && s.minutes_before_serving) {
    fail("combines nights_before_serving with minutes_before_serving");
  }

  std::visit(match{ [](std::monostate) {},
                    [&](oven_need const &o) {
                      if (o.temperature <= 0) { fail("needs a positive oven temperature"); }
                      if (o.height_slots < 1) { fail("needs at least 1 rack height slot"); }
                    },
                    [&](stovetop_need const &b) {
                      if (b.burners < 1) { fail("needs at least 1 burner"); }
                    } },
             s.equipment);
}

step_chain build_chain(recipe const &r) {
  if (r.steps.empty()) { throw malformed_recipe(r.id, "has no step groups"); }
  if (r.servings < 1) { throw malformed_recipe(r.id, "servings must be at least 1"); }

  step_chain chain{ .source = &r };
  chain.steps.reserve(r.steps.size());

  std::unordered_set<std::string> step_ids;
  std::unordered_set<int> sequences;
  for (auto const &s : r.steps) {
    if (s.id.empty()) { throw malformed_recipe(r.id, "step id must not be empty"); }
    if (!step_ids.insert(s.id).second) {
      throw malformed_recipe(r.id, "duplicate step id '" + s.id + "'");
    }
    if (!sequences.insert(s.sequence).second) {
      throw malformed_recipe(r.id,
                             "duplicate sequence index " + std::to_string(s.sequence));
    }
    validate_step(r, s);
    chain.steps.push_back(&s);
  }

  std::ranges::stable_sort(chain.steps, {}, &step_group::sequence);

  for (std::size_t i{ 0 }; i < chain.steps.size(); ++i) {
    auto const &s{ *chain.steps[i] };
    if (!s.after) { continue; }

    if (!step_ids.contains(*s.after)) {
      throw malformed_recipe(r.id,
                             "step '" + s.id + "' references non-existent predecessor '" +
                                 *s.after + "'");
    }
    if (i == 0 || chain.steps[i - 1]->id != *s.after) {
      throw malformed_recipe(r.id,
                             "step '" + s.id + "' must follow '" + *s.after +
                                 "' but the sequence order disagrees");
    }
  }

  // An earlier step must not be pinned to a later day than a step after it.
  int prev_nights{ std::numeric_limits<int>::max() };
  std::string prev_id;
  for (auto const *s : chain.steps) {
    int const nights{ s->nights_before_serving.value_or(0) };
    if (nights > prev_nights) {
      throw malformed_recipe(r.id,
                             "nights_before_serving is not monotonic: step '" + s->id +
                                 "' is pinned " + std::to_string(nights) +
                                 " nights before serving but follows step '" + prev_id +
                                 "' pinned " + std::to_string(prev_nights));
    }
    prev_nights = nights;
    prev_id = s->id;
  }

  return chain;
}

}  // namespace

step_graph step_graph_build(std::vector<recipe> const &recipes) {
  step_graph graph;
  graph.chains.reserve(recipes.size());

  std::unordered_set<std::string> recipe_ids;
  std::size_t input_order{ 0 };
  for (auto const &r : recipes) {
    if (r.id.empty()) { throw malformed_recipe(r.id, "recipe id must not be empty"); }
    if (!recipe_ids.insert(r.id).second) {
      throw malformed_recipe(r.id, "duplicate recipe id");
    }

    auto chain{ build_chain(r) };
    chain.first_input_order = input_order;
    input_order += chain.steps.size();

    MISE_TRACE_RECIPE_CHAINED(r.id, static_cast<std::int64_t>(chain.steps.size()));
    graph.chains.push_back(std::move(chain));
  }

  tui::debug("step graph: %zu recipes, %zu step groups", graph.chains.size(), input_order);
  return graph;
}

}  // namespace mise
