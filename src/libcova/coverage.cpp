#include "cova/coverage.hpp"

#include <algorithm>
#include <array>
#include <ostream>
#include <string_view>
#include <utility>

#include "cova/report.hpp"
#include "cova/version.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cova {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 4> known_debug_options{
  "config", "dataio", "sys", "trace"};

std::string join(const std::vector<std::string>& v) {
  std::string res;
  for (auto&& s : v) {
    if (!res.empty()) res += ",";
    res += s;
  }
  return res;
}

}  // namespace

void enable_debug_options(const std::vector<std::string>& options) {
  for (auto&& opt : options) {
    if (std::ranges::find(known_debug_options, opt) ==
        known_debug_options.end()) {
      LOG_WARN("Unknown debug option '{}'", opt);
      continue;
    }
    logger::enable(opt);
    if (logger::global_level < logger::level::debug)
      logger::set_level(logger::level::debug);
  }
}

coverage::coverage(
    const coverage_settings& settings, fs::path cwd, const env_lookup_t& env)
    : cwd_{std::move(cwd)} {
  enable_debug_options(settings.debug);
  cfg_ = read_config(settings.rcfile, cwd_, env);
  enable_debug_options(cfg_.debug);

  if (logger::debugging("sys")) log_sys_info();
  if (logger::debugging("config")) {
    LOG_DEBUG("config: data_file={}", cfg_.data_file.string());
    LOG_DEBUG("config: debug={}", join(cfg_.debug));
    LOG_DEBUG("config: include={}", join(cfg_.include));
    LOG_DEBUG("config: omit={}", join(cfg_.omit));
    LOG_DEBUG("config: ignore_errors={}", cfg_.ignore_errors);
    LOG_DEBUG("config: show_missing={}", cfg_.show_missing);
    if (cfg_.fail_under) LOG_DEBUG("config: fail_under={}", *cfg_.fail_under);
    if (cfg_.annotate_directory)
      LOG_DEBUG("config: annotate directory={}",
                cfg_.annotate_directory->string());
  }
}

void coverage::log_sys_info() const {
  LOG_DEBUG("sys: version={}", version);
  LOG_DEBUG("sys: cwd={}", cwd_.string());
  LOG_DEBUG("sys: data_file={}", data_file().string());
  for (auto&& f : cfg_.attempted_config_files)
    LOG_DEBUG("sys: config file tried: {}", f.string());
  LOG_DEBUG(
      "sys: config file read: {}",
      cfg_.config_file ? cfg_.config_file->string() : "-none-");
}

fs::path coverage::data_file() const { return abs_file(cfg_.data_file, cwd_); }

void coverage::load() { data_ = load_data(data_file()); }

void coverage::erase() {
  data_ = {};
  erase_data(data_file());
}

size_t coverage::combine() {
  auto n = combine_data(data_file());
  data_ = load_data(data_file());
  return n;
}

file_selection coverage::selection(const report_request& request) const {
  return {
    .include = request.include.value_or(cfg_.include),
    .omit = request.omit.value_or(cfg_.omit),
    .modules = request.modules,
    .ignore_errors = request.ignore_errors.value_or(cfg_.ignore_errors)};
}

annotate_result coverage::annotate(const report_request& request) {
  annotate_options options{
    .directory = request.directory ? request.directory
                                   : cfg_.annotate_directory};
  return annotate_files(data_, selection(request), options, cwd_);
}

double coverage::report(const report_request& request, std::ostream& out) {
  report_options options{
    .show_missing = request.show_missing.value_or(cfg_.show_missing)};
  return cova::report(data_, selection(request), options, cwd_, out);
}

}  // namespace cova
