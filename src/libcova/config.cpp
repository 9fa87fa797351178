#include "cova/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include "cova/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cova {

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

using utils::throwf;

std::optional<std::string> process_env(const char* name) {
  if (const char* v = std::getenv(name); v && *v) return std::string{v};
  return std::nullopt;
}

const std::vector<fs::path>& default_config_files() {
  static const std::vector<fs::path> files{
    ".coveragerc", "setup.cfg", "tox.ini", "pyproject.toml"};
  return files;
}

namespace {

// One "section.key = value" found in a configuration file, with the
// section already stripped of its "coverage:" or "tool.coverage." prefix.
struct setting {
  std::string section;
  std::string key;
  std::string value;
};

bool parse_bool(std::string_view value, bool& out) {
  // clang-format off
  static const std::pair<std::string_view, bool> words[] = {
    {"1", true}, {"yes", true}, {"true", true}, {"on", true},
    {"0", false}, {"no", false}, {"false", false}, {"off", false}};
  // clang-format on
  std::string lower{utils::trim(value)};
  for (auto& c : lower) c = static_cast<char>(std::tolower(c));
  for (auto&& [word, b] : words) {
    if (word == lower) {
      out = b;
      return true;
    }
  }
  return false;
}

// Boost's INI reader knows nothing of continuation lines or '#' comments.
// Fold every indented line onto the value it continues, comma-separated,
// and blank out comments.
std::string fold_continuations(std::istream& in) {
  std::ostringstream out;
  std::string pending;
  bool have_pending{false};
  auto flush = [&]() {
    if (have_pending) out << pending << "\n";
    pending.clear();
    have_pending = false;
  };

  for (std::string line; std::getline(in, line);) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    auto body = utils::trim(line);
    bool indented = !line.empty() && (line[0] == ' ' || line[0] == '\t');
    bool comment = body.starts_with('#') || body.starts_with(';');

    if (indented && have_pending && !body.empty()) {
      if (comment) continue;
      if (utils::trim(pending).ends_with('='))
        pending += " ";
      else
        pending += ",";
      pending += body;
    } else {
      flush();
      if (body.empty() || comment) {
        out << "\n";
      } else if (body.starts_with('[')) {
        out << body << "\n";
      } else {
        pending = std::string{body};
        have_pending = true;
      }
    }
  }
  flush();
  return out.str();
}

std::vector<setting> read_ini_settings(
    const fs::path& file, std::string_view section_prefix) {
  std::ifstream in(file);
  if (!in) throwf<config_error>("Couldn't read config file {}", file.string());

  std::istringstream folded{fold_continuations(in)};
  pt::ptree tree;
  try {
    pt::read_ini(folded, tree);
  } catch (const pt::ini_parser_error& e) {
    throwf<config_error>(
        "Couldn't read config file {}: line {}: {}", file.string(), e.line(),
        e.message());
  }

  std::vector<setting> res;
  for (auto&& [section, contents] : tree) {
    if (!section.starts_with(section_prefix)) continue;
    auto name = section.substr(section_prefix.size());
    for (auto&& [key, value] : contents)
      res.push_back({name, key, value.get_value<std::string>()});
  }
  return res;
}

std::string unquote(std::string_view v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') &&
      v.back() == v.front())
    return std::string{v.substr(1, v.size() - 2)};
  return std::string{v};
}

// Drop a trailing "# comment" that is not inside quotes.
std::string_view strip_toml_comment(std::string_view line) {
  char quote{0};
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quote) {
      if (c == quote) quote = 0;
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

// Quoted strings of a TOML array, joined with commas.
std::string toml_array(std::string_view body, const fs::path& file) {
  std::string res;
  char quote{0};
  std::string item;
  for (char c : body) {
    if (quote) {
      if (c == quote) {
        if (!res.empty()) res += ",";
        res += item;
        item.clear();
        quote = 0;
      } else {
        item += c;
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    }
  }
  if (quote)
    throwf<config_error>(
        "Couldn't read config file {}: unterminated string in array",
        file.string());
  return res;
}

// pyproject.toml: only the [tool.coverage.*] tables are of interest, and
// only the scalar and string-array values coverage settings use.
std::vector<setting> read_toml_settings(const fs::path& file) {
  std::ifstream in(file);
  if (!in) throwf<config_error>("Couldn't read config file {}", file.string());

  constexpr std::string_view prefix{"tool.coverage."};
  std::vector<setting> res;
  std::optional<std::string> section{};
  std::string array_key{};
  std::string array_body{};
  bool in_array{false};
  size_t linum{0};

  for (std::string raw; std::getline(in, raw);) {
    ++linum;
    auto line = utils::trim(strip_toml_comment(raw));

    if (in_array) {
      array_body += line;
      if (line.find(']') != std::string_view::npos) {
        in_array = false;
        if (section)
          res.push_back({*section, array_key, toml_array(array_body, file)});
      }
      continue;
    }
    if (line.empty()) continue;

    if (line.front() == '[') {
      if (line.back() != ']')
        throwf<config_error>(
            "Couldn't read config file {}: line {}: bad table header",
            file.string(), linum);
      auto name = utils::trim(line.substr(1, line.size() - 2));
      if (name.starts_with(prefix))
        section = std::string{name.substr(prefix.size())};
      else
        section = std::nullopt;
      continue;
    }

    auto eq = line.find('=');
    if (eq == std::string_view::npos)
      throwf<config_error>(
          "Couldn't read config file {}: line {}: expected 'key = value'",
          file.string(), linum);
    std::string key{utils::trim(line.substr(0, eq))};
    auto value = utils::trim(line.substr(eq + 1));

    if (value.starts_with('[')) {
      if (value.find(']') == std::string_view::npos) {
        in_array = true;
        array_key = key;
        array_body = std::string{value};
        continue;
      }
      if (section) res.push_back({*section, key, toml_array(value, file)});
    } else if (section) {
      res.push_back({*section, key, unquote(value)});
    }
  }
  if (in_array)
    throwf<config_error>(
        "Couldn't read config file {}: unterminated array '{}'", file.string(),
        array_key);
  return res;
}

std::vector<setting> read_settings(const fs::path& file) {
  auto name = file.filename().string();
  if (file.extension() == ".toml") return read_toml_settings(file);
  if (name == "setup.cfg" || name == "tox.ini")
    return read_ini_settings(file, "coverage:");
  return read_ini_settings(file, "");
}

}  // namespace

void set_option(
    config& cfg, std::string_view section, std::string_view key,
    const std::string& value, const fs::path& file) {
  auto bad = [&](std::string_view what) {
    throwf<config_error>(
        "{}: [{}] {}: couldn't read '{}' as {}", file.string(), section, key,
        value, what);
  };
  auto boolean = [&](bool& dst) {
    if (!parse_bool(value, dst)) bad("a boolean");
  };

  if (section == "run" && key == "data_file") {
    cfg.data_file = std::string{utils::trim(value)};
  } else if (section == "run" && key == "debug") {
    cfg.debug = utils::split_list(value);
  } else if (section == "report" && key == "include") {
    cfg.include = utils::split_list(value);
  } else if (section == "report" && key == "omit") {
    cfg.omit = utils::split_list(value);
  } else if (section == "report" && key == "ignore_errors") {
    boolean(cfg.ignore_errors);
  } else if (section == "report" && key == "show_missing") {
    boolean(cfg.show_missing);
  } else if (section == "report" && key == "fail_under") {
    auto n = utils::parse_number<double>(value);
    if (!n) bad("a number");
    cfg.fail_under = *n;
  } else if (section == "annotate" && key == "directory") {
    cfg.annotate_directory = std::string{utils::trim(value)};
  } else {
    LOG_WARN(
        "{}: unrecognized option '[{}] {}'", file.string(), section, key);
  }
}

bool apply_config_file(config& cfg, const fs::path& file, bool required) {
  cfg.attempted_config_files.push_back(file);
  if (!fs::exists(file)) {
    if (required)
      throwf<config_error>("Couldn't read '{}' as a config file", file.string());
    return false;
  }

  auto settings = read_settings(file);
  bool is_rc = file.filename() == ".coveragerc";
  if (settings.empty() && !required && !is_rc) {
    LOG_DEBUG_IF("config", "No coverage settings in {}", file.string());
    return false;
  }

  for (auto&& s : settings) set_option(cfg, s.section, s.key, s.value, file);
  cfg.config_file = file;
  LOG_DEBUG_IF(
      "config", "Read {} settings from {}", settings.size(), file.string());
  return true;
}

config read_config(
    const std::optional<fs::path>& rcfile, const fs::path& cwd,
    const env_lookup_t& env) {
  config cfg{};
  if (rcfile) {
    apply_config_file(cfg, rcfile->is_absolute() ? *rcfile : cwd / *rcfile, true);
  } else {
    for (auto&& candidate : default_config_files())
      if (apply_config_file(cfg, cwd / candidate, false)) break;
  }

  if (auto data_file = env("COVERAGE_FILE")) cfg.data_file = *data_file;
  return cfg;
}

}  // namespace cova
