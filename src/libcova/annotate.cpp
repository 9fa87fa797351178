#include "cova/annotate.hpp"

#include <re2/re2.h>

#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

#include "cova/errors.hpp"
#include "linespan.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cova {

namespace fs = std::filesystem;

using utils::throwf;

namespace {

// clang-format off
const RE2 r_blank     {R"(^\s*(?:#|//|$))"};
const RE2 r_else_only {R"(^\s*(?:\}\s*)?else\s*[:{]?\s*(?:#|//|$))"};
// clang-format on

std::string read_source(const fs::path& file) {
  std::ifstream in(file, std::ios::binary);
  if (!in) throwf<no_source_error>("No source for code: '{}'.", file.string());
  return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>()};
}

void write_annotation(const fs::path& dest, std::string_view text) {
  std::ofstream out(dest, std::ios::binary | std::ios::trunc);
  if (!out) throwf<error>("Couldn't write annotation to '{}'", dest.string());
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (!out) throwf<error>("Couldn't write annotation to '{}'", dest.string());
}

}  // namespace

std::string annotate_source(
    std::span<const char> source, const file_record& record) {
  std::vector<linum_t> statements(
      record.statements.begin(), record.statements.end());
  auto missing_set = record.missing();
  std::vector<linum_t> missing(missing_set.begin(), missing_set.end());

  std::string out;
  out.reserve(source.size() + source.size() / 8);

  size_t i{0}, j{0};
  bool covered{true};
  linespan lines{source};
  linum_t linum{0};

  for (auto it = lines.begin(); it != lines.end(); ++it) {
    ++linum;
    while (i < statements.size() && statements[i] < linum) ++i;
    while (j < missing.size() && missing[j] < linum) ++j;
    if (i < statements.size() && statements[i] == linum)
      covered = j >= missing.size() || missing[j] > linum;

    std::string_view line = *it;
    if (RE2::PartialMatch(line, r_blank)) {
      out += "  ";
    } else if (RE2::PartialMatch(line, r_else_only)) {
      // Follows the statement after it: missed, or nothing after it at all.
      if (i >= statements.size() && j >= missing.size())
        out += "! ";
      else if (i >= statements.size() || j >= missing.size())
        out += "> ";
      else if (statements[i] == missing[j])
        out += "! ";
      else
        out += "> ";
    } else if (record.excluded.contains(linum)) {
      out += "- ";
    } else if (covered) {
      out += "> ";
    } else {
      out += "! ";
    }
    out += line;
    if (it.terminated()) out += '\n';
  }
  return out;
}

std::string flat_rootname(std::string_view relative_name) {
  fs::path rel{relative_name};
  auto ext = rel.extension().string();
  std::string root{relative_name.substr(0, relative_name.size() - ext.size())};
  for (auto& c : root)
    if (c == '/' || c == '\\' || c == '.' || c == ':') c = '_';
  return root + ext;
}

fs::path annotation_destination(
    const fs::path& source, std::string_view relative_name,
    const std::optional<fs::path>& directory) {
  if (!directory) return fs::path{source.string() + ",cover"};
  return *directory / (flat_rootname(relative_name) + ",cover");
}

annotate_result annotate_files(
    const coverage_data& data, const file_selection& selection,
    const annotate_options& options, const fs::path& cwd) {
  annotate_result result;
  auto files = select_files(data, selection, cwd);

  std::optional<fs::path> directory{};
  if (options.directory) {
    directory = abs_file(*options.directory, cwd);
    std::error_code ec;
    fs::create_directories(*directory, ec);
    if (ec)
      throwf<error>(
          "Couldn't create directory '{}': {}", directory->string(),
          ec.message());
  }

  for (auto&& file : files) {
    std::string source;
    try {
      source = read_source(file);
    } catch (const no_source_error& e) {
      if (!selection.ignore_errors) throw;
      LOG_WARN("{}", e.what());
      result.skipped.push_back(file);
      continue;
    }

    auto relname = relative_name(file, cwd);
    auto dest = annotation_destination(file, relname, directory);
    LOG_INFO("Annotating {} -> {}", relname, dest.string());
    write_annotation(dest, annotate_source(source, *data.find(file)));
    result.written.push_back(dest);
  }
  return result;
}

}  // namespace cova
