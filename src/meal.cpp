#include "meal.h"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <unordered_set>

namespace mise {

namespace {

constinit std::array<std::string_view, recipe_category_count> const category_name_table{ {
    "main",       // recipe_category::main (0)
    "starch",     // recipe_category::starch (1)
    "vegetable",  // recipe_category::vegetable (2)
    "bread",      // recipe_category::bread (3)
    "dessert",    // recipe_category::dessert (4)
    "appetizer",  // recipe_category::appetizer (5)
} };

}  // namespace

std::string_view recipe_category_name(recipe_category c) {
  auto const idx{ static_cast<std::size_t>(c) };
  if (idx >= category_name_table.size()) { return "unknown"; }
  return category_name_table[idx];
}

std::optional<recipe_category> recipe_category_parse(std::string_view name) {
  if (auto it{ std::ranges::find(category_name_table, name) };
      it != category_name_table.end()) {
    return static_cast<recipe_category>(std::distance(category_name_table.begin(), it));
  }
  return std::nullopt;
}

std::string_view rack_width_name(rack_width w) {
  return w == rack_width::full ? "full" : "half";
}

std::optional<rack_width> rack_width_parse(std::string_view name) {
  if (name == "full") { return rack_width::full; }
  if (name == "half") { return rack_width::half; }
  return std::nullopt;
}

equipment_kind equipment_kind_of(equipment_need const &need) {
  return std::visit(match{ [](std::monostate) { return equipment_kind::none; },
                           [](oven_need const &) { return equipment_kind::oven; },
                           [](stovetop_need const &) { return equipment_kind::stovetop; } },
                    need);
}

std::string_view equipment_kind_name(equipment_kind k) {
  switch (k) {
    case equipment_kind::none: return "none";
    case equipment_kind::oven: return "oven";
    case equipment_kind::stovetop: return "stovetop";
  }
  return "unknown";
}

equipment_cfg equipment_cfg::defaults() {
  equipment_cfg cfg;
  cfg.ovens.push_back(oven_unit{ .id = "oven-1", .physical_racks = 2, .rack_positions = 5 });
  cfg.stovetop_burners = 4;
  return cfg;
}

void equipment_cfg_validate(equipment_cfg const &cfg) {
  std::unordered_set<std::string> ids;
  for (auto const &oven : cfg.ovens) {
    if (oven.id.empty()) { throw std::runtime_error("equipment: oven id must not be empty"); }
    if (oven.id == equipment_cfg::kStovetopId) {
      throw std::runtime_error("equipment: oven id '" + oven.id + "' is reserved");
    }
    if (!ids.insert(oven.id).second) {
      throw std::runtime_error("equipment: duplicate oven id '" + oven.id + "'");
    }
    if (oven.physical_racks < 1) {
      throw std::runtime_error("equipment: oven '" + oven.id + "' needs at least 1 rack");
    }
    if (oven.rack_positions < 1) {
      throw std::runtime_error("equipment: oven '" + oven.id +
                               "' needs at least 1 rack position");
    }
  }

  if (cfg.stovetop_burners < 0) {
    throw std::runtime_error("equipment: burner count must not be negative");
  }
}

}  // namespace mise
