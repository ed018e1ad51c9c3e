#pragma once

#include "util.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mise {

enum class recipe_category : int {
  main = 0,
  starch = 1,
  vegetable = 2,
  bread = 3,
  dessert = 4,
  appetizer = 5,
};

constexpr int recipe_category_count = 6;

std::string_view recipe_category_name(recipe_category c);
std::optional<recipe_category> recipe_category_parse(std::string_view name);

enum class rack_width { full, half };

std::string_view rack_width_name(rack_width w);
std::optional<rack_width> rack_width_parse(std::string_view name);

struct oven_need {
  int temperature;   // degrees; steps only share an oven at equal temperature
  int height_slots;  // vertical rack positions consumed within a row
  rack_width width;
};

struct stovetop_need {
  int burners;
};

// std::monostate: counter work, no shared equipment.
using equipment_need = std::variant<std::monostate, oven_need, stovetop_need>;

enum class equipment_kind { none, oven, stovetop };

equipment_kind equipment_kind_of(equipment_need const &need);
std::string_view equipment_kind_name(equipment_kind k);

struct step_group {
  std::string id;
  std::string name;
  int sequence{ 0 };
  minutes duration{ 0 };
  minutes rest_time{ 0 };  // blocks the next step of the recipe
  minutes hold_time{ 0 };  // delays serving only
  std::optional<int> nights_before_serving;
  std::optional<minutes> minutes_before_serving;
  std::optional<minutes> max_wait;  // nullopt = unlimited
  std::optional<std::string> after;  // explicit predecessor id
  equipment_need equipment;
  std::vector<std::string> instructions;

  std::string_view display_name() const { return name.empty() ? id : name; }
};

struct recipe {
  std::string id;
  std::string name;
  recipe_category category{ recipe_category::main };
  int servings{ 1 };
  std::vector<step_group> steps;

  std::string_view display_name() const { return name.empty() ? id : name; }
};

struct oven_unit {
  std::string id;
  int physical_racks{ 2 };
  int rack_positions{ 5 };

  int capacity() const { return physical_racks * rack_positions; }
};

struct equipment_cfg {
  std::vector<oven_unit> ovens;
  int stovetop_burners{ 4 };

  static constexpr std::string_view kStovetopId{ "stovetop" };

  // One 2x5 oven and four burners.
  static equipment_cfg defaults();
};

struct schedule_options {
  minutes pinned_time_of_day{ 20 * 60 };
  minutes kitchen_opens{ 6 * 60 };
  bool parallel{ true };
};

struct meal {
  std::string name;
  std::optional<std::chrono::year_month_day> date;
  instant meal_time{ 18 * 60 };
  int guest_count{ 4 };
  std::vector<recipe> recipes;
  equipment_cfg equipment{ equipment_cfg::defaults() };
  schedule_options options;
};

// Validates equipment configuration; throws std::runtime_error naming the bad field.
void equipment_cfg_validate(equipment_cfg const &cfg);

}  // namespace mise
