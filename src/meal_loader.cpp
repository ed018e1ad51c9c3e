#include "meal_loader.h"

#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace mise {

namespace {

minutes get_clock(sol::table const &table,
                  std::string_view key,
                  std::string_view context,
                  minutes default_value) {
  auto const text{ sol_util_get_optional<std::string>(table, key, context) };
  if (!text) { return default_value; }
  auto const parsed{ util_parse_clock(*text) };
  if (!parsed) {
    throw std::runtime_error(std::string{ context } + ": " + std::string{ key } +
                             " must be HH:MM, got '" + *text + "'");
  }
  return *parsed;
}

std::optional<minutes> get_minutes(sol::table const &table,
                                   std::string_view key,
                                   std::string_view context) {
  if (auto const value{ sol_util_get_optional<int>(table, key, context) }) {
    return minutes{ *value };
  }
  return std::nullopt;
}

std::vector<sol::table> get_array(sol::table const &table,
                                  std::string_view key,
                                  std::string_view context,
                                  bool required) {
  std::optional<sol::table> array;
  if (required) {
    array = sol_util_get_required<sol::table>(table, key, context);
  } else {
    array = sol_util_get_optional<sol::table>(table, key, context);
  }
  if (!array) { return {}; }

  std::vector<sol::table> out;
  for (std::size_t i{ 1 }; i <= array->size(); ++i) {
    sol::object const entry{ (*array)[i] };
    if (entry.get_type() != sol::type::table) {
      throw std::runtime_error(std::string{ context } + ": " + std::string{ key } + "[" +
                               std::to_string(i) + "] must be a table");
    }
    out.push_back(entry.as<sol::table>());
  }
  return out;
}

equipment_need parse_equipment(sol::table const &step, std::string const &context) {
  auto const oven{ sol_util_get_optional<sol::table>(step, "oven", context) };
  auto const stovetop{ sol_util_get_optional<sol::table>(step, "stovetop", context) };

  if (oven && stovetop) {
    throw std::runtime_error(context + ": a step uses either the oven or the stovetop");
  }

  if (oven) {
    auto const oven_ctx{ context + ".oven" };
    auto const width_name{
      sol_util_get_or_default<std::string>(*oven, "width", "full", oven_ctx)
    };
    auto const width{ rack_width_parse(width_name) };
    if (!width) {
      throw std::runtime_error(oven_ctx + ": width must be \"full\" or \"half\", got '" +
                               width_name + "'");
    }
    return oven_need{
      .temperature = sol_util_get_required<int>(*oven, "temperature", oven_ctx),
      .height_slots = sol_util_get_or_default<int>(*oven, "height", 1, oven_ctx),
      .width = *width,
    };
  }

  if (stovetop) {
    return stovetop_need{
      .burners = sol_util_get_or_default<int>(*stovetop, "burners", 1, context + ".stovetop"),
    };
  }

  return std::monostate{};
}

step_group parse_step(sol::table const &table, std::size_t index, std::string const &context) {
  step_group s;
  s.id = sol_util_get_required<std::string>(table, "id", context);
  s.name = sol_util_get_or_default<std::string>(table, "name", "", context);
  s.sequence = sol_util_get_or_default<int>(table, "sequence", static_cast<int>(index), context);
  s.duration = minutes{ sol_util_get_required<int>(table, "duration", context) };
  s.rest_time = get_minutes(table, "rest", context).value_or(minutes{ 0 });
  s.hold_time = get_minutes(table, "hold", context).value_or(minutes{ 0 });
  s.nights_before_serving = sol_util_get_optional<int>(table, "nights_before", context);
  s.minutes_before_serving = get_minutes(table, "minutes_before", context);
  s.max_wait = get_minutes(table, "max_wait", context);
  s.after = sol_util_get_optional<std::string>(table, "after", context);
  s.equipment = parse_equipment(table, context);

  if (auto const instructions{
          sol_util_get_optional<sol::table>(table, "instructions", context) }) {
    for (std::size_t i{ 1 }; i <= instructions->size(); ++i) {
      sol::object const line{ (*instructions)[i] };
      if (!line.is<std::string>()) {
        throw std::runtime_error(context + ": instructions[" + std::to_string(i) +
                                 "] must be a string");
      }
      s.instructions.push_back(line.as<std::string>());
    }
  }
  return s;
}

recipe parse_recipe(sol::table const &table, std::size_t index, int guest_count) {
  std::string context{ "RECIPES[" + std::to_string(index) + "]" };

  recipe r;
  r.id = sol_util_get_required<std::string>(table, "id", context);
  context += " (" + r.id + ")";
  r.name = sol_util_get_or_default<std::string>(table, "name", "", context);
  r.servings = sol_util_get_or_default<int>(table, "servings", guest_count, context);

  if (auto const category_name{
          sol_util_get_optional<std::string>(table, "category", context) }) {
    auto const category{ recipe_category_parse(*category_name) };
    if (!category) {
      throw std::runtime_error(context + ": unknown category '" + *category_name + "'");
    }
    r.category = *category;
  }

  auto const steps{ get_array(table, "steps", context, true) };
  for (std::size_t i{ 0 }; i < steps.size(); ++i) {
    r.steps.push_back(
        parse_step(steps[i], i + 1, context + ".steps[" + std::to_string(i + 1) + "]"));
  }
  return r;
}

equipment_cfg parse_equipment_cfg(sol::state &lua) {
  sol::object const obj{ lua["EQUIPMENT"] };
  if (!obj.valid() || obj.get_type() == sol::type::lua_nil) {
    return equipment_cfg::defaults();
  }
  if (obj.get_type() != sol::type::table) {
    throw std::runtime_error("EQUIPMENT must be a table");
  }
  auto const table{ obj.as<sol::table>() };

  equipment_cfg cfg{ equipment_cfg::defaults() };
  cfg.stovetop_burners =
      sol_util_get_or_default<int>(table, "burners", cfg.stovetop_burners, "EQUIPMENT");

  if (sol_util_get_optional<sol::table>(table, "ovens", "EQUIPMENT")) {
    cfg.ovens.clear();
    auto const ovens{ get_array(table, "ovens", "EQUIPMENT", true) };
    for (std::size_t i{ 0 }; i < ovens.size(); ++i) {
      std::string const context{ "EQUIPMENT.ovens[" + std::to_string(i + 1) + "]" };
      cfg.ovens.push_back(oven_unit{
          .id = sol_util_get_or_default<std::string>(
              ovens[i], "id", "oven-" + std::to_string(i + 1), context),
          .physical_racks = sol_util_get_or_default<int>(ovens[i], "racks", 2, context),
          .rack_positions = sol_util_get_or_default<int>(ovens[i], "positions", 5, context),
      });
    }
  }

  equipment_cfg_validate(cfg);
  return cfg;
}

schedule_options parse_options(sol::state &lua) {
  schedule_options options;
  sol::object const obj{ lua["OPTIONS"] };
  if (!obj.valid() || obj.get_type() == sol::type::lua_nil) { return options; }
  if (obj.get_type() != sol::type::table) {
    throw std::runtime_error("OPTIONS must be a table");
  }
  auto const table{ obj.as<sol::table>() };

  options.pinned_time_of_day =
      get_clock(table, "pinned_time", "OPTIONS", options.pinned_time_of_day);
  options.kitchen_opens = get_clock(table, "kitchen_opens", "OPTIONS", options.kitchen_opens);
  options.parallel =
      sol_util_get_or_default<bool>(table, "parallel", options.parallel, "OPTIONS");
  return options;
}

}  // namespace

meal meal_load_script(std::string_view script) {
  auto lua{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          lua->safe_script(script, sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error(std::string("Failed to execute meal script: ") + err.what());
  }

  sol::object const meal_obj{ (*lua)["MEAL"] };
  if (!meal_obj.valid() || meal_obj.get_type() != sol::type::table) {
    throw std::runtime_error("Meal file must define 'MEAL' global as a table");
  }
  auto const meal_table{ meal_obj.as<sol::table>() };

  meal m;
  m.name = sol_util_get_or_default<std::string>(meal_table, "name", "", "MEAL");
  m.guest_count = sol_util_get_or_default<int>(meal_table, "guests", m.guest_count, "MEAL");
  if (m.guest_count < 1) { throw std::runtime_error("MEAL: guests must be at least 1"); }

  auto const time_text{ sol_util_get_required<std::string>(meal_table, "time", "MEAL") };
  auto const time{ util_parse_clock(time_text) };
  if (!time) {
    throw std::runtime_error("MEAL: time must be HH:MM, got '" + time_text + "'");
  }
  m.meal_time = *time;

  if (auto const date_text{ sol_util_get_optional<std::string>(meal_table, "date", "MEAL") }) {
    m.date = util_parse_date(*date_text);
    if (!m.date) {
      throw std::runtime_error("MEAL: date must be YYYY-MM-DD, got '" + *date_text + "'");
    }
  }

  m.equipment = parse_equipment_cfg(*lua);
  m.options = parse_options(*lua);

  sol::object const recipes_obj{ (*lua)["RECIPES"] };
  if (!recipes_obj.valid() || recipes_obj.get_type() != sol::type::table) {
    throw std::runtime_error("Meal file must define 'RECIPES' global as a table");
  }
  auto const recipes_table{ recipes_obj.as<sol::table>() };
  for (std::size_t i{ 1 }; i <= recipes_table.size(); ++i) {
    sol::object const entry{ recipes_table[i] };
    if (entry.get_type() != sol::type::table) {
      throw std::runtime_error("RECIPES[" + std::to_string(i) + "] must be a table");
    }
    m.recipes.push_back(parse_recipe(entry.as<sol::table>(), i, m.guest_count));
  }

  tui::debug("meal '%s': %zu recipes, %zu ovens, %d burners",
             m.name.c_str(),
             m.recipes.size(),
             m.equipment.ovens.size(),
             m.equipment.stovetop_burners);
  return m;
}

meal meal_load(std::filesystem::path const &path) {
  tui::debug("Loading meal from file: %s", path.string().c_str());
  auto const bytes{ util_load_file(path) };
  std::string const script{ reinterpret_cast<char const *>(bytes.data()), bytes.size() };
  return meal_load_script(script);
}

}  // namespace mise
