#include "util.h"

#include <charconv>
#include <cstdio>
#include <stdexcept>
#include <system_error>

namespace mise {

namespace {

std::optional<int> parse_fixed_digits(std::string_view text) {
  if (text.empty()) { return std::nullopt; }
  int value{ 0 };
  auto const [ptr, ec]{ std::from_chars(text.data(), text.data() + text.size(), value) };
  if (ec != std::errc{} || ptr != text.data() + text.size()) { return std::nullopt; }
  return value;
}

}  // namespace

std::int64_t util_day_index(instant t) {
  auto const count{ t.count() };
  auto const per_day{ kMinutesPerDay.count() };
  auto day{ count / per_day };
  if (count % per_day != 0 && count < 0) { --day; }
  return day;
}

minutes util_time_of_day(instant t) { return t - util_day_start(util_day_index(t)); }

instant util_day_start(std::int64_t day) { return kMinutesPerDay * day; }

std::optional<minutes> util_parse_clock(std::string_view text) {
  auto const colon{ text.find(':') };
  if (colon == std::string_view::npos || colon == 0 || colon > 2) { return std::nullopt; }
  if (text.size() - colon - 1 != 2) { return std::nullopt; }

  auto const hours{ parse_fixed_digits(text.substr(0, colon)) };
  auto const mins{ parse_fixed_digits(text.substr(colon + 1)) };
  if (!hours || !mins) { return std::nullopt; }
  if (*hours < 0 || *hours > 23 || *mins < 0 || *mins > 59) { return std::nullopt; }

  return minutes{ *hours * 60 + *mins };
}

std::string util_format_clock(instant t) {
  auto const tod{ util_time_of_day(t).count() };
  char buf[8]{};
  std::snprintf(buf,
                sizeof buf,
                "%02d:%02d",
                static_cast<int>(tod / 60),
                static_cast<int>(tod % 60));
  return buf;
}

std::string util_format_instant(instant t) {
  auto const day{ util_day_index(t) };
  auto out{ util_format_clock(t) };
  if (day != 0) {
    out += day < 0 ? " (" : " (+";
    out += std::to_string(day);
    out += "d)";
  }
  return out;
}

std::optional<std::chrono::year_month_day> util_parse_date(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') { return std::nullopt; }

  auto const y{ parse_fixed_digits(text.substr(0, 4)) };
  auto const m{ parse_fixed_digits(text.substr(5, 2)) };
  auto const d{ parse_fixed_digits(text.substr(8, 2)) };
  if (!y || !m || !d) { return std::nullopt; }

  std::chrono::year_month_day const ymd{ std::chrono::year{ *y },
                                         std::chrono::month{ static_cast<unsigned>(*m) },
                                         std::chrono::day{ static_cast<unsigned>(*d) } };
  if (!ymd.ok()) { return std::nullopt; }
  return ymd;
}

std::string util_format_date(std::chrono::year_month_day serving_date, std::int64_t day) {
  std::chrono::year_month_day const ymd{ std::chrono::sys_days{ serving_date } +
                                         std::chrono::days{ day } };
  char buf[16]{};
  std::snprintf(buf,
                sizeof buf,
                "%04d-%02u-%02u",
                static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  auto file{ util_open_file(path, "wb") };
  if (!file) {
    throw std::runtime_error("util_write_file: failed to open file: " + path.string());
  }

  if (!content.empty() &&
      std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
    throw std::runtime_error("util_write_file: failed to write file: " + path.string());
  }

  if (std::fflush(file.get()) != 0) {
    throw std::runtime_error("util_write_file: failed to flush file: " + path.string());
  }
}

}  // namespace mise
