#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "cova/annotate.hpp"
#include "cova/config.hpp"
#include "cova/coverage_data.hpp"

namespace cova {

namespace fs = std::filesystem;

struct coverage_settings {
  std::optional<fs::path> rcfile{};
  std::vector<std::string> debug{};
};

// What the command line asked for.  Unset fields fall back to the
// configuration.
struct report_request {
  std::optional<fs::path> directory{};
  std::optional<bool> ignore_errors{};
  std::optional<std::vector<std::string>> include{};
  std::optional<std::vector<std::string>> omit{};
  std::optional<bool> show_missing{};
  std::vector<std::string> modules{};
};

class coverage_api {
 public:
  coverage_api() = default;
  coverage_api(const coverage_api&) = delete;
  coverage_api(coverage_api&&) = delete;
  coverage_api& operator=(const coverage_api&) = delete;
  coverage_api& operator=(coverage_api&&) = delete;
  virtual ~coverage_api() = default;

  virtual void load() = 0;
  virtual void erase() = 0;
  virtual size_t combine() = 0;
  virtual annotate_result annotate(const report_request& request) = 0;
  virtual double report(const report_request& request, std::ostream& out) = 0;
  [[nodiscard]] virtual const config& get_config() const = 0;
};

class coverage : public coverage_api {
 public:
  explicit coverage(
      const coverage_settings& settings, fs::path cwd = fs::current_path(),
      const env_lookup_t& env = process_env);

  void load() override;
  void erase() override;
  size_t combine() override;
  annotate_result annotate(const report_request& request) override;
  double report(const report_request& request, std::ostream& out) override;
  [[nodiscard]] const config& get_config() const override { return cfg_; }

  [[nodiscard]] const coverage_data& data() const { return data_; }
  [[nodiscard]] fs::path data_file() const;

 private:
  [[nodiscard]] file_selection selection(const report_request& request) const;
  void log_sys_info() const;

  fs::path cwd_;
  config cfg_;
  coverage_data data_;
};

// Turn on the named debug categories and debug-level logging.  Unknown
// names are warned about and ignored.
void enable_debug_options(const std::vector<std::string>& options);

}  // namespace cova
