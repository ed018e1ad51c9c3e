#pragma once

#include "meal.h"

#include <compare>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace mise {

// Identifies a step by its recipe's position in the meal and its position in the
// recipe's sequence-ordered chain.
struct step_key {
  std::size_t recipe{ 0 };
  std::size_t step{ 0 };

  auto operator<=>(step_key const &) const = default;
};

class malformed_recipe : public std::runtime_error {
 public:
  malformed_recipe(std::string recipe_id, std::string const &message);

  std::string const &recipe_id() const { return recipe_id_; }

 private:
  std::string recipe_id_;
};

struct step_chain {
  recipe const *source{ nullptr };
  std::vector<step_group const *> steps;  // ordered by sequence index
  std::size_t first_input_order{ 0 };     // input order of steps[0]
};

// Per-recipe chains over a frozen recipe list. Holds pointers into that list, which
// must outlive the graph.
struct step_graph {
  std::vector<step_chain> chains;

  step_group const &step(step_key key) const;
  recipe const &owner(step_key key) const;
  std::size_t chain_length(std::size_t recipe_index) const;
  std::size_t step_count() const;

  // Stable position of a step in the input (recipe order, then sequence).
  std::size_t input_order(step_key key) const;

  bool is_last(step_key key) const;

  // "recipe/step"
  std::string label(step_key key) const;
};

// Builds the chains and performs every structural check. Throws malformed_recipe.
step_graph step_graph_build(std::vector<recipe> const &recipes);

// Duration plus rest: the span that blocks the next step of the same recipe.
inline minutes step_blocking_span(step_group const &step) {
  return step.duration + step.rest_time;
}

}  // namespace mise
