#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <format>
#include <functional>
#include <print>
#include <set>
#include <source_location>
#include <string>
#include <string_view>

namespace cova::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  default: return "UNKNOWN";
  }
  // clang-format on
}

inline level global_level = level::warning;  // NOLINT
inline void set_level(level level) { global_level = level; }

// Debug categories switched on by --debug or COVERAGE_DEBUG.
inline std::set<std::string, std::less<>> debug_categories;  // NOLINT

inline void enable(std::string_view category) {
  debug_categories.emplace(category);
}
inline bool debugging(std::string_view category) {
  return debug_categories.contains(category);
}

inline std::string get_current_timestamp() {
  using namespace std::chrono;

  auto now = system_clock::now();
  auto ymd = year_month_day{floor<days>(now)};
  auto hms = hh_mm_ss{floor<milliseconds>(now - floor<days>(now))};

  return std::format("{} {}", ymd, hms);
}

// Core logging function.  Goes to stderr, stdout belongs to the reports.
template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    std::format_string<Args...> fmt, Args&&... args) {
  if (level > global_level) return;

  std::println(
      stderr, "{} {}:{} {}: {}", get_current_timestamp(),
      std::filesystem::path{location.file_name()}.filename().c_str(),
      location.line(), level_to_string(level),
      std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace cova::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                             \
  cova::logger::log(                                               \
      cova::logger::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                             \
  cova::logger::log(                                               \
      cova::logger::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(...) \
  cova::logger::log(  \
      cova::logger::level::info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...)                                                \
  cova::logger::log(                                                 \
      cova::logger::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(...)                                             \
  cova::logger::log(                                               \
      cova::logger::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(...)                                             \
  cova::logger::log(                                               \
      cova::logger::level::fatal, std::source_location::current(), \
      __VA_ARGS__)

// Debug output for one --debug category.
#define LOG_DEBUG_IF(category, ...)                                  \
  do {                                                               \
    if (cova::logger::debugging(category)) LOG_DEBUG(__VA_ARGS__);   \
  } while (0)
// NOLINTEND
