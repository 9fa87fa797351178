#include <exception>
#include <string>
#include <vector>

#include "../libcova/logger.hpp"
#include "cova/cmdline.hpp"

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  try {
    cova::coverage_script script{};
    return script.command_line(args);
  } catch (std::exception& e) {
    LOG_FATAL("Whoops {}", e.what());
    return cova::err_status;
  }
}
