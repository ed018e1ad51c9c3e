#pragma once

#include "meal.h"

#include <filesystem>
#include <string_view>
#include <vector>

namespace mise {

// Loads a meal description from a Lua file defining the globals MEAL, RECIPES and,
// optionally, EQUIPMENT and OPTIONS. Throws std::runtime_error naming the offending
// field. Structural recipe checks are left to step_graph_build.
meal meal_load(std::filesystem::path const &path);
meal meal_load_script(std::string_view script);

}  // namespace mise
