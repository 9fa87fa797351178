#pragma once

#include <string_view>

namespace cova {

inline constexpr std::string_view version{"1.0.0"};

}  // namespace cova
