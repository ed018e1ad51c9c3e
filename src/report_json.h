#pragma once

#include "reporter.h"

#include <string>

namespace mise {

// Serialized form of a schedule report, handed to rendering and persistence
// collaborators. Instants are minutes from 00:00 of the serving day, with a
// formatted "HH:MM" companion field.
std::string report_to_json(schedule_report const &report, bool pretty = true);

}  // namespace mise
