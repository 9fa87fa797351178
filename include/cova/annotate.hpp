#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cova/coverage_data.hpp"
#include "cova/file_matcher.hpp"

namespace cova {

namespace fs = std::filesystem;

struct annotate_options {
  std::optional<fs::path> directory{};
};

struct annotate_result {
  std::vector<fs::path> written;
  std::vector<fs::path> skipped;
};

// Marked-up copy of `source`: every line prefixed with "> ", "! ", "- "
// or two blanks.
std::string annotate_source(
    std::span<const char> source, const file_record& record);

// "pkg/mod.py" -> "pkg_mod.py"
std::string flat_rootname(std::string_view relative_name);

fs::path annotation_destination(
    const fs::path& source, std::string_view relative_name,
    const std::optional<fs::path>& directory);

annotate_result annotate_files(
    const coverage_data& data, const file_selection& selection,
    const annotate_options& options, const fs::path& cwd);

}  // namespace cova
