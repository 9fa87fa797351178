#pragma once

#include <stdexcept>

namespace cova {

// Base of every error the command line reports as a plain message.
struct error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct no_source_error : error {
  using error::error;
};

struct no_data_error : error {
  using error::error;
};

struct data_error : error {
  using error::error;
};

struct config_error : error {
  using error::error;
};

}  // namespace cova
