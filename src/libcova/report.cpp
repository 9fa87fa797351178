#include "cova/report.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "cova/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cova {

namespace fs = std::filesystem;

double numbers::pc_covered() const {
  if (statements == 0) return 100.0;
  return 100.0 * static_cast<double>(executed()) /
         static_cast<double>(statements);
}

std::string numbers::pc_covered_str() const {
  auto pc = pc_covered();
  if (pc > 0.0 && pc < 1.0)
    pc = 1.0;
  else if (pc > 99.0 && pc < 100.0)
    pc = 99.0;
  else
    pc = std::nearbyint(pc);
  return fmt::format("{:.0f}", pc);
}

std::string format_lines(const lineset_t& statements, const lineset_t& lines) {
  std::vector<std::pair<linum_t, linum_t>> pairs;
  std::optional<linum_t> start{};
  linum_t end{};

  auto st = statements.begin();
  auto ln = lines.begin();
  for (; st != statements.end() && ln != lines.end(); ++st) {
    if (*st == *ln) {
      if (!start) start = *ln;
      end = *ln;
      ++ln;
    } else if (start) {
      pairs.emplace_back(*start, end);
      start = std::nullopt;
    }
  }
  if (start) pairs.emplace_back(*start, end);

  std::string res;
  for (auto&& [a, b] : pairs) {
    if (!res.empty()) res += ", ";
    res += a == b ? fmt::format("{}", a) : fmt::format("{}-{}", a, b);
  }
  return res;
}

bool should_fail_under(double total, double fail_under) {
  if (fail_under < 0.0 || fail_under > 100.0)
    utils::throwf<config_error>(
        "fail_under={} is invalid. Must be between 0 and 100.", fail_under);
  // Only a perfect run satisfies 100, rounding must not hide a miss.
  if (fail_under == 100.0) return total != 100.0;
  return std::nearbyint(total) < fail_under;
}

double report(
    const coverage_data& data, const file_selection& selection,
    const report_options& options, const fs::path& cwd, std::ostream& out) {
  struct row {
    std::string name;
    numbers nums;
    std::string missing;
  };

  std::vector<row> rows;
  for (auto&& file : select_files(data, selection, cwd)) {
    const auto& rec = *data.find(file);
    auto missing = rec.missing();
    rows.push_back(
        {relative_name(file, cwd), {rec.statements.size(), missing.size()},
         options.show_missing ? format_lines(rec.statements, missing) : ""});
  }
  std::ranges::sort(rows, {}, &row::name);

  size_t max_name{5};  // "TOTAL"
  for (auto&& r : rows) max_name = std::max(max_name, r.name.size());

  auto header = fmt::format("{:<{}}   Stmts   Miss  Cover", "Name", max_name);
  if (options.show_missing) header += "   Missing";
  auto rule = std::string(header.size(), '-');

  auto line = [&](const std::string& name, const numbers& n,
                  std::string_view missing) {
    auto s = fmt::format(
        "{:<{}}  {:>6} {:>6} {:>5}%", name, max_name, n.statements, n.missing,
        n.pc_covered_str());
    if (options.show_missing && !missing.empty()) s += fmt::format("   {}", missing);
    return s;
  };

  numbers total{};
  out << header << "\n" << rule << "\n";
  for (auto&& r : rows) {
    out << line(r.name, r.nums, r.missing) << "\n";
    total += r.nums;
  }
  if (rows.size() > 1) out << rule << "\n" << line("TOTAL", total, "") << "\n";

  LOG_DEBUG_IF(
      "trace", "Reported {} files, {} statements, {} missing", rows.size(),
      total.statements, total.missing);
  return total.pc_covered();
}

}  // namespace cova
