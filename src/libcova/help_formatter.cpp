#include "help_formatter.hpp"

#include <fmt/format.h>

namespace cova {

std::vector<std::string> wrap_text(std::string_view text, size_t width) {
  std::vector<std::string> lines;
  std::string current;
  size_t pos{0};
  while (pos < text.size()) {
    auto start = text.find_first_not_of(" \t\n", pos);
    if (start == std::string_view::npos) break;
    auto stop = text.find_first_of(" \t\n", start);
    if (stop == std::string_view::npos) stop = text.size();
    auto word = text.substr(start, stop - start);
    pos = stop;

    if (current.empty()) {
      current = word;
    } else if (current.size() + 1 + word.size() <= width) {
      current += ' ';
      current += word;
    } else {
      lines.push_back(std::move(current));
      current = word;
    }
  }
  if (!current.empty()) lines.push_back(std::move(current));
  return lines;
}

std::string optparse_formatter::option_names(const CLI::Option* opt) {
  const auto& metavar = opt->get_option_text();
  std::string res;
  auto add = [&](const std::string& s) {
    if (!res.empty()) res += ", ";
    res += s;
  };
  for (auto&& s : opt->get_snames())
    add(metavar.empty() ? "-" + s : fmt::format("-{} {}", s, metavar));
  for (auto&& l : opt->get_lnames())
    add(metavar.empty() ? "--" + l : fmt::format("--{}={}", l, metavar));
  return res;
}

std::string optparse_formatter::make_help(
    const CLI::App* app, std::string, CLI::AppFormatMode) const {
  std::string out = fmt::format("Usage: {}\n\n", usage_);
  for (auto&& line : wrap_text(app->get_description(), width))
    out += line + "\n";

  out += "\nOptions:\n";
  const auto column = help_position - 4;
  for (const CLI::Option* opt : app->get_options(
           [](const CLI::Option* o) { return o->nonpositional(); })) {
    auto names = option_names(opt);
    std::string help = opt->get_description();
    if (!opt->get_envname().empty())
      help += fmt::format(" [env: {}]", opt->get_envname());
    auto lines = wrap_text(help, width - help_position);

    size_t first{0};
    if (names.size() <= column && !lines.empty()) {
      out += fmt::format("  {:<{}}  {}\n", names, column, lines[0]);
      first = 1;
    } else {
      out += fmt::format("  {}\n", names);
    }
    for (size_t i = first; i < lines.size(); ++i)
      out += fmt::format("{:{}}{}\n", "", help_position, lines[i]);
  }
  return out;
}

}  // namespace cova
