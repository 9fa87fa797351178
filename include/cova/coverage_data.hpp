#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <set>
#include <string_view>
#include <vector>

namespace cova {

namespace fs = std::filesystem;

using linum_t = size_t;
using lineset_t = std::set<linum_t>;

struct file_record {
  lineset_t statements;
  lineset_t executed;
  lineset_t excluded;

  [[nodiscard]] lineset_t missing() const;
};

// Keyed by absolute, lexically normal source path.
struct coverage_data {
  std::map<fs::path, file_record> files;

  [[nodiscard]] bool empty() const { return files.empty(); }
  [[nodiscard]] const file_record* find(const fs::path& file) const;
  [[nodiscard]] std::vector<fs::path> measured_files() const;
};

// Read a data file.  The JSON format is the native one; LCOV tracefiles
// are detected by extension (".info") or by their first record.  A
// missing file reads as empty data, a malformed one throws data_error.
coverage_data load_data(const fs::path& data_file);

// Relative paths in the data are resolved against the directory of
// `data_file`, which must be absolute.
coverage_data parse_json_data(std::string_view text, const fs::path& data_file);
coverage_data parse_lcov_data(std::string_view text, const fs::path& data_file);

void save_data(const coverage_data& data, const fs::path& data_file);

void merge_data(coverage_data& into, const coverage_data& from);

// Parallel data files sit beside data_file and are named
// "<data_file>.<suffix>".  Sorted.
std::vector<fs::path> find_parallel_files(const fs::path& data_file);

// Merge all parallel files into data_file and delete them.  Returns the
// number of files combined; throws no_data_error if there were none.
size_t combine_data(const fs::path& data_file);

void erase_data(const fs::path& data_file);

}  // namespace cova
