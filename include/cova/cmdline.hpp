#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cova/coverage.hpp"

namespace cova {

// Exit statuses.
inline constexpr int ok_status = 0;
inline constexpr int err_status = 1;
inline constexpr int fail_under_status = 2;

using coverage_factory_t =
    std::function<std::unique_ptr<coverage_api>(const coverage_settings&)>;

struct command_info {
  std::string_view name;
  std::string_view args;
  std::string_view summary;
  std::string_view description;
};

const std::vector<command_info>& commands();

// The `coverage` command line.  Output goes to `out`, error messages and
// usage hints to `err`.
class coverage_script {
 public:
  coverage_script();
  coverage_script(coverage_factory_t factory, std::ostream& out, std::ostream& err);

  int command_line(std::span<const std::string> args);

 private:
  int do_command_line(std::span<const std::string> args);
  int do_help(std::span<const std::string> args);
  int help_error(std::string_view message);
  [[nodiscard]] std::string general_help() const;
  [[nodiscard]] std::string command_help(const command_info& cmd) const;

  coverage_factory_t factory_;
  std::ostream* out_;
  std::ostream* err_;
};

}  // namespace cova
