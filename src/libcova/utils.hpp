#pragma once

#include <fmt/format.h>

#include <charconv>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cova::utils {

template <typename Exception = std::runtime_error, typename... Args>
[[noreturn]] void throwf(
    fmt::format_string<Args...> format_str, Args&&... args) {
  throw Exception(fmt::format(format_str, std::forward<Args>(args)...));
}

inline std::string_view trim(std::string_view sv) {
  constexpr std::string_view blanks{" \t\r\n"};
  auto b = sv.find_first_not_of(blanks);
  if (b == std::string_view::npos) return {};
  auto e = sv.find_last_not_of(blanks);
  return sv.substr(b, e - b + 1);
}

// Split a comma (or newline) separated list, dropping empty entries.
inline std::vector<std::string> split_list(std::string_view text) {
  std::vector<std::string> result;
  while (!text.empty()) {
    auto pos = text.find_first_of(",\n");
    auto item = trim(text.substr(0, pos));
    if (!item.empty()) result.emplace_back(item);
    if (pos == std::string_view::npos) break;
    text.remove_prefix(pos + 1);
  }
  return result;
}

template <typename T>
std::optional<T> parse_number(std::string_view sv) {
  sv = trim(sv);
  T result{};
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
  if (ec == std::errc{} && ptr == sv.data() + sv.size() && !sv.empty())
    return result;
  else
    return std::nullopt;
}

}  // namespace cova::utils
