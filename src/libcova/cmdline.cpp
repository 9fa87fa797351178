#include "cova/cmdline.hpp"

#include <fmt/format.h>

#include <CLI/CLI.hpp>
#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cova/errors.hpp"
#include "cova/report.hpp"
#include "cova/version.hpp"
#include "help_formatter.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cova {

namespace fs = std::filesystem;

const std::vector<command_info>& commands() {
  // clang-format off
  static const std::vector<command_info> cmds{
    {"annotate", "[options] [modules]",
     "Annotate source files with execution information.",
     "Make annotated copies of the given files, marking statements that are "
     "executed with > and statements that are missed with !."},
    {"combine", "[options]",
     "Combine a number of data files.",
     "Combine data from multiple parallel coverage data files. The combined "
     "results are written to a single file representing the union of the "
     "data."},
    {"erase", "[options]",
     "Erase previously collected coverage data.",
     "Erase previously collected coverage data."},
    {"help", "[options] [command]",
     "Get help on using coverage.",
     "Describe how to use coverage, in general or a specific command."},
    {"report", "[options] [modules]",
     "Report coverage stats on modules.",
     "Report coverage statistics on modules."},
  };
  // clang-format on
  return cmds;
}

namespace {

const command_info* find_command(std::string_view name) {
  for (auto&& cmd : commands())
    if (cmd.name == name) return &cmd;
  return nullptr;
}

struct command_options {
  bool help{};
  bool ignore_errors{};
  bool show_missing{};
  std::optional<std::string> directory{};
  std::optional<std::string> include{};
  std::optional<std::string> omit{};
  std::optional<std::string> debug{};
  std::optional<std::string> rcfile{};
  std::optional<double> fail_under{};
  std::vector<std::string> args{};
};

std::unique_ptr<CLI::App> make_app(
    const command_info& cmd, command_options& opts) {
  auto app = std::make_unique<CLI::App>(
      std::string{cmd.description}, std::string{cmd.name});
  app->formatter(std::make_shared<optparse_formatter>(
      fmt::format("coverage {} {}", cmd.name, cmd.args)));
  app->set_help_flag();
  app->allow_extras();

  auto directory = [&]() {
    app->add_option("-d,--directory", opts.directory,
                    "Write the output files to DIR.")
        ->option_text("DIR");
  };
  auto fail_under = [&]() {
    app->add_option("--fail-under", opts.fail_under,
                    "Exit with a status of 2 if the total coverage is less "
                    "than MIN.")
        ->option_text("MIN");
  };
  auto ignore_errors = [&]() {
    app->add_flag("-i,--ignore-errors", opts.ignore_errors,
                  "Ignore errors while reading source files.");
  };
  auto include = [&]() {
    app->add_option("--include", opts.include,
                    "Include only files whose paths match one of these "
                    "patterns. Accepts shell-style wildcards, which must be "
                    "quoted.")
        ->option_text("PAT1,PAT2,...");
  };
  auto omit = [&]() {
    app->add_option("--omit", opts.omit,
                    "Omit files whose paths match one of these patterns. "
                    "Accepts shell-style wildcards, which must be quoted.")
        ->option_text("PAT1,PAT2,...");
  };
  auto show_missing = [&]() {
    app->add_flag("-m,--show-missing", opts.show_missing,
                  "Show line numbers of statements in each module that "
                  "weren't executed.");
  };
  auto common = [&]() {
    app->add_option("--debug", opts.debug,
                    "Debug options, separated by commas.")
        ->option_text("OPTS")
        ->envname("COVERAGE_DEBUG");
    app->add_flag("-h,--help", opts.help, "Get help on this command.");
    app->add_option("--rcfile", opts.rcfile,
                    "Specify configuration file. By default '.coveragerc', "
                    "'setup.cfg', 'tox.ini', and 'pyproject.toml' are tried.")
        ->option_text("RCFILE")
        ->envname("COVERAGE_RCFILE");
  };

  if (cmd.name == "annotate") {
    directory();
    ignore_errors();
    include();
    omit();
  } else if (cmd.name == "report") {
    fail_under();
    ignore_errors();
    include();
    omit();
    show_missing();
  }
  common();
  app->add_option("args", opts.args, "Files or topics.");
  return app;
}

std::string join(std::span<const std::string> v, std::string_view sep) {
  std::string res;
  for (auto&& s : v) {
    if (!res.empty()) res += sep;
    res += s;
  }
  return res;
}

report_request make_request(const command_options& opts) {
  report_request req{};
  if (opts.directory) req.directory = fs::path{*opts.directory};
  if (opts.ignore_errors) req.ignore_errors = true;
  if (opts.include) req.include = utils::split_list(*opts.include);
  if (opts.omit) req.omit = utils::split_list(*opts.omit);
  if (opts.show_missing) req.show_missing = true;
  req.modules = opts.args;
  return req;
}

}  // namespace

coverage_script::coverage_script()
    : coverage_script{
        [](const coverage_settings& s) -> std::unique_ptr<coverage_api> {
          return std::make_unique<coverage>(s);
        },
        std::cout, std::cerr} {}

coverage_script::coverage_script(
    coverage_factory_t factory, std::ostream& out, std::ostream& err)
    : factory_{std::move(factory)}, out_{&out}, err_{&err} {}

int coverage_script::command_line(std::span<const std::string> args) {
  try {
    return do_command_line(args);
  } catch (const error& e) {
    LOG_DEBUG("{} raised: {}", args.empty() ? "" : args[0], e.what());
    *err_ << e.what() << "\n";
    return err_status;
  }
}

int coverage_script::help_error(std::string_view message) {
  *err_ << message << "\nUse 'coverage help' for help.\n";
  return err_status;
}

std::string coverage_script::general_help() const {
  std::string out = fmt::format(
      "Coverage annotation, version {}\n\n"
      "Usage: coverage <command> [options] [args]\n\n"
      "Commands:\n",
      version);
  for (auto&& cmd : commands())
    out += fmt::format("    {:<12}{}\n", cmd.name, cmd.summary);
  out += "\nUse \"coverage help <command>\" for detailed help on any command.\n";
  return out;
}

std::string coverage_script::command_help(const command_info& cmd) const {
  command_options unused{};
  return make_app(cmd, unused)->help();
}

int coverage_script::do_help(std::span<const std::string> topics) {
  if (topics.empty()) {
    *out_ << general_help();
    return ok_status;
  }
  if (auto* cmd = find_command(topics[0])) {
    *out_ << command_help(*cmd);
    return ok_status;
  }
  return help_error(fmt::format("Don't know topic '{}'", topics[0]));
}

int coverage_script::do_command_line(std::span<const std::string> args) {
  if (args.empty()) {
    *out_ << "Code coverage annotation.  Use 'coverage help' for help.\n";
    return ok_status;
  }

  const auto& name = args[0];
  if (name == "--version") {
    *out_ << fmt::format("Coverage annotation, version {}\n", version);
    return ok_status;
  }
  if (name == "-h" || name == "--help") {
    *out_ << general_help();
    return ok_status;
  }

  const auto* cmd = find_command(name);
  if (!cmd) return help_error(fmt::format("Unknown command: '{}'", name));

  command_options opts{};
  auto app = make_app(*cmd, opts);
  // CLI11 consumes its argument vector from the back.
  std::vector<std::string> rargs(args.rbegin(), args.rend() - 1);
  try {
    app->parse(rargs);
  } catch (const CLI::ParseError& e) {
    return help_error(e.what());
  }
  if (auto extras = app->remaining(); !extras.empty())
    return help_error(fmt::format("no such option: {}", extras.front()));

  if (opts.help) {
    *out_ << app->help();
    return ok_status;
  }
  if (cmd->name == "help") return do_help(opts.args);

  if ((cmd->name == "erase" || cmd->name == "combine") && !opts.args.empty())
    return help_error(
        fmt::format("Unexpected arguments: {}", join(opts.args, " ")));

  coverage_settings settings{};
  if (opts.rcfile) settings.rcfile = fs::path{*opts.rcfile};
  if (opts.debug) settings.debug = utils::split_list(*opts.debug);

  auto cov = factory_(settings);
  if (cmd->name == "erase") {
    cov->erase();
  } else if (cmd->name == "combine") {
    auto n = cov->combine();
    LOG_INFO("Combined {} data files", n);
  } else if (cmd->name == "annotate") {
    cov->load();
    cov->annotate(make_request(opts));
  } else if (cmd->name == "report") {
    cov->load();
    auto total = cov->report(make_request(opts), *out_);
    auto fail_under =
        opts.fail_under ? opts.fail_under : cov->get_config().fail_under;
    if (fail_under && should_fail_under(total, *fail_under)) {
      *err_ << fmt::format(
          "Coverage failure: total of {:.0f} is less than fail-under={:g}\n",
          std::nearbyint(total), *fail_under);
      return fail_under_status;
    }
  }
  return ok_status;
}

}  // namespace cova
