#include "report_json.h"

#include "util.h"

#include "picojson.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mise {

namespace {

picojson::value num(std::int64_t value) { return picojson::value(static_cast<double>(value)); }

picojson::value str(std::string_view value) { return picojson::value(std::string{ value }); }

void put_instant(picojson::object &obj, std::string const &key, instant at) {
  obj[key] = num(at.count());
  obj[key + "_display"] = str(util_format_instant(at));
}

picojson::value to_json(assignment const &a) {
  picojson::object obj;
  obj["recipe"] = str(a.recipe_id);
  obj["step"] = str(a.step_id);
  obj["recipe_name"] = str(a.recipe_name);
  obj["step_name"] = str(a.step_name);
  obj["kind"] = str(equipment_kind_name(a.kind));
  obj["equipment"] = a.equipment.empty() ? picojson::value{} : str(a.equipment);
  put_instant(obj, "start", a.start);
  put_instant(obj, "end", a.end);
  put_instant(obj, "ready", a.ready);
  if (a.rack_row) { obj["rack_row"] = num(*a.rack_row); }
  if (a.temperature) { obj["temperature"] = num(*a.temperature); }
  if (a.burners) { obj["burners"] = num(*a.burners); }
  obj["pinned"] = picojson::value(a.pinned);
  return picojson::value(obj);
}

picojson::value to_json(timeline_entry const &e) {
  picojson::object obj;
  put_instant(obj, "at", e.at);
  obj["action"] = str(timeline_action_name(e.action));
  if (!e.recipe_id.empty()) {
    obj["recipe"] = str(e.recipe_id);
    obj["step"] = str(e.step_id);
  }
  if (!e.equipment.empty()) { obj["equipment"] = str(e.equipment); }
  obj["description"] = str(e.description);
  return picojson::value(obj);
}

picojson::value to_json(unit_utilization const &u) {
  picojson::object obj;
  obj["id"] = str(u.id);
  obj["kind"] = str(equipment_kind_name(u.kind));
  if (u.first_start) { put_instant(obj, "first_start", *u.first_start); }
  if (u.last_end) { put_instant(obj, "last_end", *u.last_end); }
  obj["busy_minutes"] = num(u.busy.count());

  picojson::array changes;
  for (auto const &c : u.changes) {
    picojson::object change;
    put_instant(change, "at", c.at);
    change[u.kind == equipment_kind::oven ? "temperature" : "burners"] = num(c.value);
    changes.push_back(picojson::value(change));
  }
  obj["changes"] = picojson::value(changes);

  if (u.kind == equipment_kind::oven) {
    obj["temperature_changes"] = num(u.temperature_changes);
  } else {
    obj["peak_burners"] = num(u.peak_burners);
  }
  return picojson::value(obj);
}

picojson::value to_json(reported_conflict const &c) {
  picojson::object obj;
  obj["kind"] = str(conflict_kind_name(c.kind));
  obj["status"] = str(conflict_status_name(c.status));
  obj["recipe"] = str(c.recipe_id);
  obj["step"] = str(c.step_id);
  obj["equipment"] = c.equipment.empty() ? picojson::value{} : str(c.equipment);

  picojson::array blockers;
  for (auto const &b : c.blockers) { blockers.push_back(str(b)); }
  obj["blockers"] = picojson::value(blockers);

  put_instant(obj, "window_start", c.window_start);
  put_instant(obj, "window_end", c.window_end);
  obj["message"] = str(c.message);
  return picojson::value(obj);
}

template <typename T>
picojson::value to_json_array(std::vector<T> const &items) {
  picojson::array out;
  out.reserve(items.size());
  for (auto const &item : items) { out.push_back(to_json(item)); }
  return picojson::value(out);
}

}  // namespace

std::string report_to_json(schedule_report const &report, bool pretty) {
  picojson::object meal;
  meal["name"] = str(report.meal_name);
  meal["date"] =
      report.meal_date ? str(util_format_date(*report.meal_date, 0)) : picojson::value{};
  put_instant(meal, "time", report.meal_time);
  meal["guests"] = num(report.guest_count);

  picojson::object categories;
  for (auto const &c : report.categories) {
    categories[std::string{ recipe_category_name(c.category) }] = num(c.dishes);
  }
  meal["categories"] = picojson::value(categories);

  picojson::array stages;
  for (auto const s : report.stages) { stages.push_back(str(run_stage_name(s))); }

  picojson::array warnings;
  for (auto const &w : report.warnings) { warnings.push_back(str(w)); }

  picojson::object checks;
  checks["all_ready_by_meal_time"] = picojson::value(report.checks.all_ready_by_meal_time);
  checks["no_equipment_overbooked"] = picojson::value(report.checks.no_equipment_overbooked);

  picojson::object root;
  root["meal"] = picojson::value(meal);
  root["stages"] = picojson::value(stages);
  root["assignments"] = to_json_array(report.assignments);
  root["timeline"] = to_json_array(report.timeline);
  root["utilization"] = to_json_array(report.utilization);
  root["conflicts"] = to_json_array(report.conflicts);
  root["warnings"] = picojson::value(warnings);
  root["checks"] = picojson::value(checks);

  return picojson::value(root).serialize(pretty);
}

}  // namespace mise
