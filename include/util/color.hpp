#pragma once

#include <string_view>

namespace apg::Color {
constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view RED = "\033[91m";
constexpr std::string_view GREEN = "\033[92m";
constexpr std::string_view YELLOW = "\033[93m";
}  // namespace apg::Color
