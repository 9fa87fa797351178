#include <doctest/doctest.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cova/config.hpp"
#include "cova/errors.hpp"
#include "scratch.hpp"

namespace fs = std::filesystem;

namespace {

std::optional<std::string> no_env(const char*) { return std::nullopt; }

using strings = std::vector<std::string>;

}  // namespace

TEST_CASE_FIXTURE(ScratchFixture, "defaults") {
  auto cfg = cova::read_config({}, dir, no_env);
  CHECK(cfg.data_file == fs::path{".coverage"});
  CHECK(cfg.include.empty());
  CHECK(cfg.omit.empty());
  CHECK_FALSE(cfg.ignore_errors);
  CHECK_FALSE(cfg.show_missing);
  CHECK_FALSE(cfg.fail_under);
  CHECK_FALSE(cfg.annotate_directory);
  CHECK_FALSE(cfg.config_file);
  CHECK(cfg.attempted_config_files.size() == 4);
}

TEST_CASE_FIXTURE(ScratchFixture, "coveragerc") {
  write(
      ".coveragerc",
      "# comment\n"
      "[run]\n"
      "data_file = .mycov\n"
      "\n"
      "[report]\n"
      "ignore_errors = yes\n"
      "show_missing = On\n"
      "fail_under = 87.5\n"
      "; another comment\n"
      "include =\n"
      "    src/*\n"
      "    # not a pattern\n"
      "    lib/*\n"
      "omit = */test_*, */conftest.py\n"
      "\n"
      "[annotate]\n"
      "directory = ann\n");

  auto cfg = cova::read_config({}, dir, no_env);
  CHECK(cfg.config_file == dir / ".coveragerc");
  CHECK(cfg.data_file == fs::path{".mycov"});
  CHECK(cfg.ignore_errors);
  CHECK(cfg.show_missing);
  CHECK(cfg.fail_under == 87.5);
  CHECK(cfg.include == strings{"src/*", "lib/*"});
  CHECK(cfg.omit == strings{"*/test_*", "*/conftest.py"});
  CHECK(cfg.annotate_directory == fs::path{"ann"});
  CHECK(cfg.attempted_config_files == std::vector<fs::path>{dir / ".coveragerc"});
}

TEST_CASE_FIXTURE(ScratchFixture, "an empty coveragerc still wins") {
  write(".coveragerc", "");
  write("setup.cfg", "[coverage:report]\nshow_missing = true\n");

  auto cfg = cova::read_config({}, dir, no_env);
  CHECK(cfg.config_file == dir / ".coveragerc");
  CHECK_FALSE(cfg.show_missing);
}

TEST_CASE_FIXTURE(ScratchFixture, "setup.cfg and tox.ini need coverage sections") {
  write("setup.cfg", "[metadata]\nname = thing\n");
  write(
      "tox.ini",
      "[tox]\nenvlist = py3\n\n[coverage:report]\nomit =\n  a.py\n  b.py\n");

  auto cfg = cova::read_config({}, dir, no_env);
  CHECK(cfg.config_file == dir / "tox.ini");
  CHECK(cfg.omit == strings{"a.py", "b.py"});
  CHECK(
      cfg.attempted_config_files ==
      std::vector<fs::path>{
          dir / ".coveragerc", dir / "setup.cfg", dir / "tox.ini"});
}

TEST_CASE_FIXTURE(ScratchFixture, "pyproject.toml") {
  write(
      "pyproject.toml",
      "[project]\n"
      "name = \"thing\"\n"
      "\n"
      "[tool.coverage.run]\n"
      "data_file = \"build/.coverage\"  # where\n"
      "debug = [\"config\"]\n"
      "\n"
      "[tool.coverage.report]\n"
      "show_missing = true\n"
      "fail_under = 90\n"
      "omit = [\n"
      "    \"*/tests/*\",  # tests\n"
      "    'setup.py',\n"
      "]\n");

  auto cfg = cova::read_config({}, dir, no_env);
  CHECK(cfg.config_file == dir / "pyproject.toml");
  CHECK(cfg.data_file == fs::path{"build/.coverage"});
  CHECK(cfg.debug == strings{"config"});
  CHECK(cfg.show_missing);
  CHECK(cfg.fail_under == 90.0);
  CHECK(cfg.omit == strings{"*/tests/*", "setup.py"});
}

TEST_CASE_FIXTURE(ScratchFixture, "pyproject.toml without coverage tables") {
  write("pyproject.toml", "[project]\nname = \"thing\"\n");
  auto cfg = cova::read_config({}, dir, no_env);
  CHECK_FALSE(cfg.config_file);
}

TEST_CASE_FIXTURE(ScratchFixture, "explicit rcfile") {
  write(".coveragerc", "[report]\nshow_missing = true\n");
  write("my.ini", "[report]\nignore_errors = 1\n");

  auto cfg = cova::read_config(fs::path{"my.ini"}, dir, no_env);
  CHECK(cfg.config_file == dir / "my.ini");
  CHECK(cfg.ignore_errors);
  CHECK_FALSE(cfg.show_missing);

  auto message =
      "Couldn't read '" + (dir / "nope.ini").string() + "' as a config file";
  CHECK_THROWS_WITH_AS(
      cova::read_config(fs::path{"nope.ini"}, dir, no_env), message.c_str(),
      cova::config_error);
}

TEST_CASE_FIXTURE(ScratchFixture, "COVERAGE_FILE overrides the data file") {
  write(".coveragerc", "[run]\ndata_file = from_rc\n");
  auto env = [](const char* name) -> std::optional<std::string> {
    if (std::string_view{name} == "COVERAGE_FILE") return "from_env";
    return std::nullopt;
  };
  CHECK(cova::read_config({}, dir, env).data_file == fs::path{"from_env"});
}

TEST_CASE_FIXTURE(ScratchFixture, "bad values") {
  SUBCASE("boolean") {
    write(".coveragerc", "[report]\nshow_missing = maybe\n");
    CHECK_THROWS_AS(cova::read_config({}, dir, no_env), cova::config_error);
  }
  SUBCASE("number") {
    write(".coveragerc", "[report]\nfail_under = lots\n");
    CHECK_THROWS_AS(cova::read_config({}, dir, no_env), cova::config_error);
  }
  SUBCASE("syntax") {
    write(".coveragerc", "[report\nshow_missing = 1\n");
    CHECK_THROWS_AS(cova::read_config({}, dir, no_env), cova::config_error);
  }
  SUBCASE("toml array") {
    write("pyproject.toml", "[tool.coverage.report]\nomit = [\"a.py\",\n");
    CHECK_THROWS_AS(cova::read_config({}, dir, no_env), cova::config_error);
  }
}

TEST_CASE("set_option") {
  cova::config cfg;
  cova::set_option(cfg, "report", "include", "a, b,,c", "x.ini");
  CHECK(cfg.include == strings{"a", "b", "c"});

  // Unknown options are only warned about.
  CHECK_NOTHROW(cova::set_option(cfg, "report", "precision", "2", "x.ini"));
  CHECK_NOTHROW(cova::set_option(cfg, "html", "directory", "h", "x.ini"));

  CHECK_THROWS_WITH_AS(
      cova::set_option(cfg, "report", "ignore_errors", "sure", "x.ini"),
      "x.ini: [report] ignore_errors: couldn't read 'sure' as a boolean",
      cova::config_error);
}
