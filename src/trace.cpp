#include "trace.h"

#include "run_stage.h"
#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace mise {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(bool_string(value));
}

void append_stage(std::string &out, char const *key, run_stage stage) {
  append_kv(out, key, run_stage_name(stage));

  char number_key[64]{};
  std::snprintf(number_key, sizeof number_key, "%s_num", key);
  append_kv(out, number_key, static_cast<std::int64_t>(static_cast<int>(stage)));
}

std::string clock_string(std::int64_t minutes_value) {
  return util_format_instant(instant{ minutes_value });
}

}  // namespace

stage_trace_scope::stage_trace_scope(run_stage stage_value)
    : stage{ stage_value }, start{ std::chrono::steady_clock::now() } {
  MISE_TRACE_STAGE_START(stage);
}

stage_trace_scope::~stage_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  MISE_TRACE_STAGE_COMPLETE(stage, static_cast<std::int64_t>(duration_ms));
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(stage_start),
          TRACE_NAME(stage_complete),
          TRACE_NAME(recipe_chained),
          TRACE_NAME(window_solved),
          TRACE_NAME(deadline_unmet),
          TRACE_NAME(partition_formed),
          TRACE_NAME(step_placed),
          TRACE_NAME(step_unplaced),
          TRACE_NAME(step_released),
          TRACE_NAME(repair_attempt),
          TRACE_NAME(repair_complete),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::stage_start const &value) {
            std::ostringstream oss;
            oss << "stage_start stage=" << run_stage_name(value.stage);
            return oss.str();
          },
          [](trace_events::stage_complete const &value) {
            std::ostringstream oss;
            oss << "stage_complete stage=" << run_stage_name(value.stage)
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::recipe_chained const &value) {
            std::ostringstream oss;
            oss << "recipe_chained recipe=" << value.recipe << " steps=" << value.step_count;
            return oss.str();
          },
          [](trace_events::window_solved const &value) {
            std::ostringstream oss;
            oss << "window_solved recipe=" << value.recipe << " step=" << value.step
                << " latest_start=" << clock_string(value.latest_start)
                << " pinned=" << bool_string(value.pinned);
            return oss.str();
          },
          [](trace_events::deadline_unmet const &value) {
            std::ostringstream oss;
            oss << "deadline_unmet recipe=" << value.recipe << " step=" << value.step
                << " latest_start=" << clock_string(value.latest_start)
                << " origin=" << clock_string(value.origin);
            return oss.str();
          },
          [](trace_events::partition_formed const &value) {
            std::ostringstream oss;
            oss << "partition_formed temperature=" << value.temperature
                << " runs=" << value.run_count << " steps=" << value.step_count;
            return oss.str();
          },
          [](trace_events::step_placed const &value) {
            std::ostringstream oss;
            oss << "step_placed recipe=" << value.recipe << " step=" << value.step
                << " unit=" << value.unit << " start=" << clock_string(value.start)
                << " end=" << clock_string(value.end);
            return oss.str();
          },
          [](trace_events::step_unplaced const &value) {
            std::ostringstream oss;
            oss << "step_unplaced recipe=" << value.recipe << " step=" << value.step
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::step_released const &value) {
            std::ostringstream oss;
            oss << "step_released recipe=" << value.recipe << " step=" << value.step
                << " unit=" << value.unit;
            return oss.str();
          },
          [](trace_events::repair_attempt const &value) {
            std::ostringstream oss;
            oss << "repair_attempt recipe=" << value.recipe << " step=" << value.step
                << " strategy=" << value.strategy
                << " window=" << clock_string(value.window_start) << ".."
                << clock_string(value.window_end);
            return oss.str();
          },
          [](trace_events::repair_complete const &value) {
            std::ostringstream oss;
            oss << "repair_complete recipe=" << value.recipe << " step=" << value.step
                << " success=" << bool_string(value.success)
                << " shift_minutes=" << value.shift_minutes;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  auto const append_step{ [&](std::string_view recipe, std::string_view step) {
    append_kv(output, "recipe", recipe);
    append_kv(output, "step", step);
  } };

  std::visit(
      match{
          [&](trace_events::stage_start const &value) {
            append_stage(output, "stage", value.stage);
          },
          [&](trace_events::stage_complete const &value) {
            append_stage(output, "stage", value.stage);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::recipe_chained const &value) {
            append_kv(output, "recipe", std::string_view{ value.recipe });
            append_kv(output, "step_count", value.step_count);
          },
          [&](trace_events::window_solved const &value) {
            append_step(value.recipe, value.step);
            append_kv(output, "latest_start", value.latest_start);
            append_kv(output, "pinned", value.pinned);
          },
          [&](trace_events::deadline_unmet const &value) {
            append_step(value.recipe, value.step);
            append_kv(output, "latest_start", value.latest_start);
            append_kv(output, "origin", value.origin);
          },
          [&](trace_events::partition_formed const &value) {
            append_kv(output, "temperature", value.temperature);
            append_kv(output, "run_count", value.run_count);
            append_kv(output, "step_count", value.step_count);
          },
          [&](trace_events::step_placed const &value) {
            append_step(value.recipe, value.step);
            append_kv(output, "unit", std::string_view{ value.unit });
            append_kv(output, "start", value.start);
            append_kv(output, "end", value.end);
          },
          [&](trace_events::step_unplaced const &value) {
            append_step(value.recipe, value.step);
            append_kv(output, "reason", std::string_view{ value.reason });
          },
          [&](trace_events::step_released const &value) {
            append_step(value.recipe, value.step);
            append_kv(output, "unit", std::string_view{ value.unit });
          },
          [&](trace_events::repair_attempt const &value) {
            append_step(value.recipe, value.step);
            append_kv(output, "strategy", std::string_view{ value.strategy });
            append_kv(output, "window_start", value.window_start);
            append_kv(output, "window_end", value.window_end);
          },
          [&](trace_events::repair_complete const &value) {
            append_step(value.recipe, value.step);
            append_kv(output, "success", value.success);
            append_kv(output, "shift_minutes", value.shift_minutes);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace mise
