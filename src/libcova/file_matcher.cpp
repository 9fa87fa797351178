#include "cova/file_matcher.hpp"

#include <fnmatch.h>

#include <algorithm>

#include "cova/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cova {

namespace fs = std::filesystem;

fs::path abs_file(const fs::path& file, const fs::path& cwd) {
  return (file.is_absolute() ? file : cwd / file).lexically_normal();
}

std::string prep_pattern(std::string_view pattern, const fs::path& cwd) {
  if (pattern.starts_with('*') || pattern.starts_with('?'))
    return std::string{pattern};
  return abs_file(fs::path{pattern}, cwd).string();
}

file_matcher::file_matcher(
    const std::vector<std::string>& patterns, const fs::path& cwd) {
  patterns_.reserve(patterns.size());
  for (auto&& p : patterns) patterns_.push_back(prep_pattern(p, cwd));
}

bool file_matcher::matches(const fs::path& file) const {
  auto name = file.string();
  return std::ranges::any_of(patterns_, [&](const std::string& pat) {
    return ::fnmatch(pat.c_str(), name.c_str(), 0) == 0;
  });
}

std::string relative_name(const fs::path& file, const fs::path& cwd) {
  auto rel = file.lexically_relative(cwd.lexically_normal());
  if (rel.empty() || *rel.begin() == "..") return file.string();
  return rel.string();
}

std::vector<fs::path> select_files(
    const coverage_data& data, const file_selection& selection,
    const fs::path& cwd) {
  if (data.empty()) utils::throwf<no_data_error>("No data to report.");

  file_matcher include{selection.include, cwd};
  file_matcher omit{selection.omit, cwd};

  std::vector<fs::path> candidates;
  if (selection.modules.empty()) {
    candidates = data.measured_files();
  } else {
    for (auto&& m : selection.modules) {
      auto file = abs_file(m, cwd);
      if (data.find(file)) {
        candidates.push_back(file);
      } else if (selection.ignore_errors) {
        LOG_WARN("No data collected for file: {}", m);
      } else {
        utils::throwf<no_data_error>("No data collected for file: {}", m);
      }
    }
  }

  std::vector<fs::path> res;
  for (auto&& file : candidates) {
    if (!include.empty() && !include.matches(file)) {
      LOG_DEBUG_IF("trace", "Not including {}: no include pattern matched",
                   file.string());
      continue;
    }
    if (omit.matches(file)) {
      LOG_DEBUG_IF("trace", "Omitting {}", file.string());
      continue;
    }
    LOG_DEBUG_IF("trace", "Selected {}", file.string());
    res.push_back(file);
  }
  if (res.empty()) utils::throwf<no_data_error>("No data to report.");
  return res;
}

}  // namespace cova
