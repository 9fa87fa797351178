#include "cova/coverage_data.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <cstdint>
#include <boost/json.hpp>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>

#include "cova/errors.hpp"
#include "json_helpers.hpp"
#include "linespan.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cova {

namespace fs = std::filesystem;
namespace json = boost::json;

using utils::throwf;

lineset_t file_record::missing() const {
  lineset_t res;
  std::ranges::set_difference(
      statements, executed, std::inserter(res, res.end()));
  return res;
}

const file_record* coverage_data::find(const fs::path& file) const {
  auto probe = files.find(file);
  return probe == files.end() ? nullptr : &probe->second;
}

std::vector<fs::path> coverage_data::measured_files() const {
  std::vector<fs::path> res;
  res.reserve(files.size());
  for (auto&& [path, rec] : files) res.push_back(path);
  return res;
}

namespace {

fs::path resolve(std::string_view name, const fs::path& data_file) {
  fs::path p{name};
  if (p.is_relative()) p = data_file.parent_path() / p;
  return p.lexically_normal();
}

void add_record(coverage_data& data, const fs::path& file, file_record rec) {
  auto [probe, inserted] = data.files.try_emplace(file, std::move(rec));
  if (!inserted) {
    auto& have = probe->second;
    have.statements.merge(rec.statements);
    have.executed.merge(rec.executed);
    have.excluded.merge(rec.excluded);
  }
}

bool looks_like_lcov(const fs::path& data_file, std::string_view text) {
  if (data_file.extension() == ".info") return true;
  for (auto&& line : linespan{text}) {
    auto l = utils::trim(line);
    if (l.empty()) continue;
    return l.starts_with("TN:") || l.starts_with("SF:");
  }
  return false;
}

}  // namespace

coverage_data parse_json_data(
    std::string_view text, const fs::path& data_file) {
  boost::system::error_code ec;
  json::value root = json::parse(json::string_view{text.data(), text.size()}, ec);
  if (ec)
    throwf<data_error>(
        "Couldn't read data from '{}': {}", data_file.string(), ec.message());

  auto* obj = root.if_object();
  auto* files = obj ? obj->if_contains("files") : nullptr;
  if (!files || !files->is_object())
    throwf<data_error>(
        "Couldn't read data from '{}': no 'files' object", data_file.string());

  coverage_data data;
  for (auto&& kv : files->get_object()) {
    std::string name(kv.key().data(), kv.key().size());
    auto* rec_obj = kv.value().if_object();
    if (!rec_obj)
      throwf<data_error>(
          "Couldn't read data from '{}': bad entry for '{}'",
          data_file.string(), name);

    file_record rec;
    rec.executed = lines_from_json(*rec_obj, "executed_lines", data_file);
    rec.statements = lines_from_json(*rec_obj, "missing_lines", data_file);
    rec.statements.insert(rec.executed.begin(), rec.executed.end());
    rec.excluded = lines_from_json(*rec_obj, "excluded_lines", data_file);
    add_record(data, resolve(name, data_file), std::move(rec));
  }
  return data;
}

coverage_data parse_lcov_data(
    std::string_view text, const fs::path& data_file) {
  static const RE2 r_source_file{R"(SF:(.+))"};
  static const RE2 r_line_data{R"(DA:(\d+),(\d+)(?:,.*)?)"};

  coverage_data data;
  std::optional<fs::path> current{};
  file_record rec{};
  size_t linum{0};

  for (auto&& raw : linespan{text}) {
    ++linum;
    auto line = utils::trim(raw);
    std::string file;
    linum_t da_line{};
    uint64_t da_count{};

    if (RE2::FullMatch(line, r_source_file, &file)) {
      current = resolve(file, data_file);
      rec = {};
    } else if (RE2::FullMatch(line, r_line_data, &da_line, &da_count)) {
      if (!current)
        throwf<data_error>(
            "Couldn't read data from '{}': line {}: DA outside of a record",
            data_file.string(), linum);
      if (da_line == 0)
        throwf<data_error>(
            "Couldn't read data from '{}': line {}: bad line number",
            data_file.string(), linum);
      rec.statements.insert(da_line);
      if (da_count > 0) rec.executed.insert(da_line);
    } else if (line == "end_of_record") {
      if (!current)
        throwf<data_error>(
            "Couldn't read data from '{}': line {}: unmatched end_of_record",
            data_file.string(), linum);
      add_record(data, *current, std::move(rec));
      current = std::nullopt;
      rec = {};
    } else if (line.starts_with("DA:")) {
      throwf<data_error>(
          "Couldn't read data from '{}': line {}: malformed '{}'",
          data_file.string(), linum, line);
    }
  }
  if (current)
    throwf<data_error>(
        "Couldn't read data from '{}': record for '{}' not terminated",
        data_file.string(), current->string());
  return data;
}

coverage_data load_data(const fs::path& data_file) {
  auto path = fs::absolute(data_file);
  if (!fs::exists(path)) {
    LOG_DEBUG_IF("dataio", "No data file at {}", path.string());
    return {};
  }

  std::ifstream blob(path, std::ios::binary);
  if (!blob) throwf<data_error>("Couldn't read data from '{}'", path.string());
  std::string content(
      (std::istreambuf_iterator<char>(blob)), std::istreambuf_iterator<char>());

  bool lcov = looks_like_lcov(path, content);
  LOG_DEBUG_IF(
      "dataio", "Reading {} data from {}", lcov ? "lcov" : "json",
      path.string());
  auto data =
      lcov ? parse_lcov_data(content, path) : parse_json_data(content, path);
  LOG_DEBUG_IF("dataio", "Read {} files from {}", data.files.size(),
               path.string());
  return data;
}

void save_data(const coverage_data& data, const fs::path& data_file) {
  json::object files;
  for (auto&& [path, rec] : data.files)
    files[path.string()] = record_to_json(rec);

  json::object meta;
  meta["format"] = 1;
  json::object root;
  root["meta"] = std::move(meta);
  root["files"] = std::move(files);

  LOG_DEBUG_IF(
      "dataio", "Writing {} files to {}", data.files.size(),
      data_file.string());
  std::ofstream out(data_file, std::ios::binary | std::ios::trunc);
  if (!out)
    throwf<data_error>("Couldn't write data to '{}'", data_file.string());
  out << json::serialize(root) << "\n";
  if (!out)
    throwf<data_error>("Couldn't write data to '{}'", data_file.string());
}

void merge_data(coverage_data& into, const coverage_data& from) {
  for (auto&& [path, rec] : from.files) add_record(into, path, rec);
}

std::vector<fs::path> find_parallel_files(const fs::path& data_file) {
  auto abs = fs::absolute(data_file);
  auto dir = abs.parent_path();
  auto prefix = abs.filename().string() + ".";

  std::vector<fs::path> res;
  std::error_code ec;
  for (auto&& entry : fs::directory_iterator{dir, ec}) {
    auto name = entry.path().filename().string();
    if (entry.is_regular_file() && name.starts_with(prefix) &&
        name.size() > prefix.size())
      res.push_back(entry.path());
  }
  if (ec)
    throwf<data_error>(
        "Couldn't list data files in '{}': {}", dir.string(), ec.message());
  std::ranges::sort(res);
  return res;
}

size_t combine_data(const fs::path& data_file) {
  auto parallel = find_parallel_files(data_file);
  if (parallel.empty()) throwf<no_data_error>("No data to combine");

  auto data = load_data(data_file);
  for (auto&& p : parallel) {
    LOG_DEBUG_IF("dataio", "Combining data file {}", p.string());
    merge_data(data, load_data(p));
  }
  save_data(data, data_file);

  for (auto&& p : parallel) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec)
      throwf<data_error>(
          "Couldn't remove '{}': {}", p.string(), ec.message());
  }
  return parallel.size();
}

void erase_data(const fs::path& data_file) {
  auto victims = find_parallel_files(data_file);
  victims.insert(victims.begin(), fs::absolute(data_file));
  for (auto&& p : victims) {
    std::error_code ec;
    if (fs::remove(p, ec))
      LOG_DEBUG_IF("dataio", "Erased {}", p.string());
    if (ec)
      throwf<data_error>(
          "Couldn't remove '{}': {}", p.string(), ec.message());
  }
}

}  // namespace cova
