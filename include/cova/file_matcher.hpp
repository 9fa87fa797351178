#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "cova/coverage_data.hpp"

namespace cova {

namespace fs = std::filesystem;

// Shell-style glob matching (fnmatch) against absolute paths.
class file_matcher {
 public:
  file_matcher() = default;
  file_matcher(const std::vector<std::string>& patterns, const fs::path& cwd);

  [[nodiscard]] bool matches(const fs::path& file) const;
  [[nodiscard]] bool empty() const { return patterns_.empty(); }
  [[nodiscard]] const std::vector<std::string>& patterns() const {
    return patterns_;
  }

 private:
  std::vector<std::string> patterns_;
};

// Patterns starting with a wildcard stay as they are, the rest are made
// absolute against cwd.
std::string prep_pattern(std::string_view pattern, const fs::path& cwd);

// Path relative to cwd when the file lives under it, else absolute.
std::string relative_name(const fs::path& file, const fs::path& cwd);

fs::path abs_file(const fs::path& file, const fs::path& cwd);

struct file_selection {
  std::vector<std::string> include;
  std::vector<std::string> omit;
  std::vector<std::string> modules;
  bool ignore_errors{};
};

// Files of `data` taking part in a report or an annotation, in the order
// they should be processed.  Throws no_data_error when nothing is left.
std::vector<fs::path> select_files(
    const coverage_data& data, const file_selection& selection,
    const fs::path& cwd);

}  // namespace cova
