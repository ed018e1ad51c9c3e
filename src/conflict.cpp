#include "conflict.h"

#include <array>

namespace mise {

namespace {

constinit std::array<std::string_view, conflict_kind_count> const kind_name_table{ {
    "unmet_deadline",           // conflict_kind::unmet_deadline (0)
    "equipment_overbooked",     // conflict_kind::equipment_overbooked (1)
    "insufficient_rack_space",  // conflict_kind::insufficient_rack_space (2)
    "burner_overbooked",        // conflict_kind::burner_overbooked (3)
} };

}  // namespace

std::string_view conflict_kind_name(conflict_kind k) {
  auto const idx{ static_cast<std::size_t>(k) };
  if (idx >= kind_name_table.size()) { return "unknown"; }
  return kind_name_table[idx];
}

std::string_view conflict_status_name(conflict_status s) {
  return s == conflict_status::fatal ? "fatal" : "unresolved";
}

std::string conflict_describe(conflict const &c, step_graph const &graph) {
  std::string out{ graph.label(c.key) };

  switch (c.kind) {
    case conflict_kind::unmet_deadline:
      out += " would have to start at " + util_format_instant(c.window_end) +
             ", before the kitchen opens at " + util_format_instant(c.window_start);
      break;
    case conflict_kind::equipment_overbooked:
      out += c.equipment.empty()
                 ? std::string{ " has no oven to run on" }
                 : " cannot share " + c.equipment + " with a dish at another temperature";
      break;
    case conflict_kind::insufficient_rack_space:
      out += " does not fit on the racks of " + c.equipment;
      break;
    case conflict_kind::burner_overbooked:
      out += " needs more burners than " + c.equipment + " has free";
      break;
  }

  if (c.kind != conflict_kind::unmet_deadline) {
    out += " between " + util_format_instant(c.window_start) + " and " +
           util_format_instant(c.window_end);
  }

  if (!c.blockers.empty()) {
    out += "; blocked by ";
    for (std::size_t i{ 0 }; i < c.blockers.size(); ++i) {
      if (i > 0) { out += ", "; }
      out += graph.label(c.blockers[i]);
    }
  }
  return out;
}

}  // namespace mise
