#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <filesystem>
#include <string_view>

#include "cova/coverage_data.hpp"
#include "cova/errors.hpp"
#include "utils.hpp"

namespace cova {

namespace json = boost::json;
namespace fs = std::filesystem;

inline json::array lines_to_json(const lineset_t& lines) {
  json::array res;
  res.reserve(lines.size());
  for (auto l : lines) res.emplace_back(static_cast<std::int64_t>(l));
  return res;
}

inline json::object record_to_json(const file_record& rec) {
  json::object res;
  res["executed_lines"] = lines_to_json(rec.executed);
  res["missing_lines"] = lines_to_json(rec.missing());
  res["excluded_lines"] = lines_to_json(rec.excluded);
  return res;
}

// Absent key reads as no lines.
inline lineset_t lines_from_json(
    const json::object& obj, std::string_view key, const fs::path& data_file) {
  lineset_t res;
  auto* v = obj.if_contains(json::string_view{key.data(), key.size()});
  if (!v) return res;
  auto* arr = v->if_array();
  if (!arr)
    utils::throwf<data_error>(
        "Couldn't read data from '{}': '{}' is not a list", data_file.string(),
        key);
  for (auto&& elem : *arr) {
    auto* n = elem.if_int64();
    if (!n || *n <= 0)
      utils::throwf<data_error>(
          "Couldn't read data from '{}': bad line number in '{}'",
          data_file.string(), key);
    res.insert(static_cast<linum_t>(*n));
  }
  return res;
}

}  // namespace cova
