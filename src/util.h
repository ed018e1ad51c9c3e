#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mise {

template <typename T, typename... Types>
concept one_of = (std::same_as<T, Types> || ...);

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

using minutes = std::chrono::minutes;

// Minutes relative to 00:00 of the serving day. Negative values fall on earlier days.
using instant = std::chrono::minutes;

inline constexpr minutes kMinutesPerDay{ 24 * 60 };

// Day index of an instant: 0 = serving day, -1 = the day before, ...
std::int64_t util_day_index(instant t);

// Time of day in [0, 1440) minutes.
minutes util_time_of_day(instant t);

// 00:00 of the given day index.
instant util_day_start(std::int64_t day);

// Parse "HH:MM" (24h). Returns nullopt when malformed or out of range.
std::optional<minutes> util_parse_clock(std::string_view text);

// Format a time of day as "HH:MM". Instants on other days are reduced to their
// time of day.
std::string util_format_clock(instant t);

// "HH:MM" on the serving day, "HH:MM (-1d)" on earlier days, "HH:MM (+1d)" after.
std::string util_format_instant(instant t);

// Parse an ISO calendar date "YYYY-MM-DD". Returns nullopt when malformed or invalid.
std::optional<std::chrono::year_month_day> util_parse_date(std::string_view text);

// ISO date of `day` days after `serving_date`.
std::string util_format_date(std::chrono::year_month_day serving_date, std::int64_t day);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Write text to a file, replacing its contents. Throws std::runtime_error on failure.
void util_write_file(std::filesystem::path const &path, std::string_view content);

}  // namespace mise
