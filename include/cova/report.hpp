#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>

#include "cova/coverage_data.hpp"
#include "cova/file_matcher.hpp"

namespace cova {

namespace fs = std::filesystem;

struct numbers {
  size_t statements{};
  size_t missing{};

  [[nodiscard]] size_t executed() const { return statements - missing; }
  [[nodiscard]] double pc_covered() const;
  // Rounded, but never "0" or "100" for partial coverage.
  [[nodiscard]] std::string pc_covered_str() const;

  numbers& operator+=(const numbers& other) {
    statements += other.statements;
    missing += other.missing;
    return *this;
  }
};

// "1-2, 5": runs of missing lines, where a run spans consecutive
// statements regardless of the non-statement lines in between.
std::string format_lines(const lineset_t& statements, const lineset_t& lines);

bool should_fail_under(double total, double fail_under);

struct report_options {
  bool show_missing{};
};

// Write the summary table to `out`; returns the total percentage.
double report(
    const coverage_data& data, const file_selection& selection,
    const report_options& options, const fs::path& cwd, std::ostream& out);

}  // namespace cova
