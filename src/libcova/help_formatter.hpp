#pragma once

#include <CLI/CLI.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cova {

// Greedy word wrap; words longer than `width` get a line of their own.
std::vector<std::string> wrap_text(std::string_view text, size_t width);

// Lays out a command's help the classic optparse way:
//
//   Usage: coverage annotate [options] [modules]
//
//   <description, wrapped at 78 columns>
//
//   Options:
//     -d DIR, --directory=DIR
//                           Write the output files to DIR.
//     -i, --ignore-errors   Ignore errors while reading source files.
//
// Option values are named by the option's `option_text`, environment
// fallbacks are appended to the help as "[env: NAME]".
class optparse_formatter : public CLI::FormatterBase {
 public:
  static constexpr size_t width = 78;
  static constexpr size_t help_position = 24;

  explicit optparse_formatter(std::string usage) : usage_{std::move(usage)} {}

  std::string make_help(
      const CLI::App* app, std::string name,
      CLI::AppFormatMode mode) const override;

  static std::string option_names(const CLI::Option* opt);

 private:
  std::string usage_;
};

}  // namespace cova
