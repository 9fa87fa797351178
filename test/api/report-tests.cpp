#include <doctest/doctest.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "cova/coverage.hpp"
#include "cova/errors.hpp"
#include "cova/report.hpp"
#include "scratch.hpp"

namespace fs = std::filesystem;

namespace {

struct report_output {
  double total;
  std::string text;
};

report_output run_report(
    const cova::coverage_data& data, const cova::file_selection& sel = {},
    bool show_missing = false) {
  std::ostringstream out;
  auto total = cova::report(data, sel, {.show_missing = show_missing}, "/proj", out);
  return {total, out.str()};
}

cova::coverage_data two_files() {
  cova::coverage_data data;
  data.files["/proj/a.py"] = {
      {1, 2, 3, 5, 6, 8, 9, 10, 12, 13}, {1, 2, 3, 5, 9, 10, 12, 13}, {}};
  data.files["/proj/pkg/b.py"] = {{1, 2, 3}, {1, 2, 3}, {}};
  return data;
}

}  // namespace

TEST_CASE("numbers") {
  CHECK(cova::numbers{10, 2}.executed() == 8);
  CHECK(cova::numbers{10, 2}.pc_covered() == doctest::Approx(80.0));
  CHECK(cova::numbers{0, 0}.pc_covered() == 100.0);

  CHECK(cova::numbers{0, 0}.pc_covered_str() == "100");
  CHECK(cova::numbers{3, 1}.pc_covered_str() == "67");
  CHECK(cova::numbers{8, 1}.pc_covered_str() == "88");
  // Partial coverage never shows as 0% or 100%.
  CHECK(cova::numbers{1000, 1}.pc_covered_str() == "99");
  CHECK(cova::numbers{1000, 999}.pc_covered_str() == "1");
  CHECK(cova::numbers{5, 5}.pc_covered_str() == "0");

  cova::numbers sum{};
  sum += {10, 2};
  sum += {3, 0};
  CHECK(sum.statements == 13);
  CHECK(sum.missing == 2);
}

TEST_CASE("format_lines") {
  cova::lineset_t stmts{1, 2, 3, 5, 6, 8, 9, 10, 12, 13};
  CHECK(cova::format_lines(stmts, {5, 6, 8, 12}) == "5-8, 12");
  CHECK(cova::format_lines(stmts, {1}) == "1");
  CHECK(cova::format_lines(stmts, {}) == "");
  CHECK(cova::format_lines({1, 3, 5}, {3}) == "3");
  CHECK(cova::format_lines({1, 2, 4, 5}, {1, 2, 4, 5}) == "1-5");
}

TEST_CASE("should_fail_under") {
  CHECK(cova::should_fail_under(79.6, 80.0) == false);
  CHECK(cova::should_fail_under(79.4, 80.0) == true);
  CHECK(cova::should_fail_under(100.0, 100.0) == false);
  CHECK(cova::should_fail_under(99.99, 100.0) == true);
  CHECK(cova::should_fail_under(0.0, 0.0) == false);
  CHECK_THROWS_AS(cova::should_fail_under(50.0, -1.0), cova::config_error);
  CHECK_THROWS_AS(cova::should_fail_under(50.0, 100.5), cova::config_error);
}

TEST_CASE("report table") {
  auto res = run_report(two_files());
  CHECK(res.total == doctest::Approx(100.0 * 11 / 13));
  CHECK(
      res.text ==
      "Name       Stmts   Miss  Cover\n"
      "------------------------------\n"
      "a.py          10      2    80%\n"
      "pkg/b.py       3      0   100%\n"
      "------------------------------\n"
      "TOTAL         13      2    85%\n");
}

TEST_CASE("report table with missing lines") {
  auto res = run_report(two_files(), {}, true);
  CHECK(
      res.text ==
      "Name       Stmts   Miss  Cover   Missing\n"
      "----------------------------------------\n"
      "a.py          10      2    80%   6-8\n"
      "pkg/b.py       3      0   100%\n"
      "----------------------------------------\n"
      "TOTAL         13      2    85%\n");
}

TEST_CASE("report on one file has no total") {
  auto res = run_report(two_files(), {.modules = {"a.py"}}, true);
  CHECK(res.total == doctest::Approx(80.0));
  CHECK(
      res.text ==
      "Name    Stmts   Miss  Cover   Missing\n"
      "-------------------------------------\n"
      "a.py       10      2    80%   6-8\n");
}

TEST_CASE("report with nothing to report") {
  CHECK_THROWS_WITH_AS(
      run_report({}), "No data to report.", cova::no_data_error);
}

TEST_CASE_FIXTURE(ScratchFixture, "report through the coverage object") {
  write(
      ".coverage",
      R"({"files": {"a.py": {"executed_lines": [1, 2], "missing_lines": [4]},)"
      R"( "b.py": {"executed_lines": [1]}}})");
  write(".coveragerc", "[report]\nshow_missing = true\nomit = b.py\n");

  cova::coverage cov{{}, dir, [](const char*) -> std::optional<std::string> {
                       return std::nullopt;
                     }};
  cov.load();

  std::ostringstream out;
  auto total = cov.report({}, out);
  CHECK(total == doctest::Approx(200.0 / 3));
  CHECK(
      out.str() ==
      "Name    Stmts   Miss  Cover   Missing\n"
      "-------------------------------------\n"
      "a.py        3      1    67%   4\n");

  // Options given on the command line beat the configuration.
  out.str("");
  cov.report({.include = std::vector<std::string>{"*"},
              .omit = std::vector<std::string>{},
              .show_missing = false},
             out);
  CHECK(
      out.str() ==
      "Name    Stmts   Miss  Cover\n"
      "---------------------------\n"
      "a.py        3      1    67%\n"
      "b.py        1      0   100%\n"
      "---------------------------\n"
      "TOTAL       4      1    75%\n");
}
