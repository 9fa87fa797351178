#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cova {

namespace fs = std::filesystem;

struct config {
  // [run]
  fs::path data_file{".coverage"};
  std::vector<std::string> debug;
  // [report]
  std::vector<std::string> include;
  std::vector<std::string> omit;
  bool ignore_errors{};
  bool show_missing{};
  std::optional<double> fail_under;
  // [annotate]
  std::optional<fs::path> annotate_directory;

  // The file settings were read from, if any, and every file looked at.
  std::optional<fs::path> config_file;
  std::vector<fs::path> attempted_config_files;
};

using env_lookup_t = std::function<std::optional<std::string>(const char*)>;

std::optional<std::string> process_env(const char* name);

// Candidates tried, in order, when no rcfile is given.
const std::vector<fs::path>& default_config_files();

// Build the configuration: defaults, then the configuration file (the
// explicit `rcfile`, or the first usable default candidate in cwd), then
// environment overrides.
config read_config(
    const std::optional<fs::path>& rcfile, const fs::path& cwd,
    const env_lookup_t& env = process_env);

// Apply one configuration file.  Returns false when the file is absent or
// carries no coverage settings.  A `required` file that is missing throws
// config_error.
bool apply_config_file(config& cfg, const fs::path& file, bool required);

// Set one option from its textual value, as read from `file`.
void set_option(
    config& cfg, std::string_view section, std::string_view key,
    const std::string& value, const fs::path& file);

}  // namespace cova
