#pragma once
#include <string>

namespace seagreen::util {

// Build a retro-styled meter: [████░░░░].
// pct in 0..100, width is the number of cells inside the brackets.
auto retro_bar(double pct, int width = 20, const std::string& fill = "█", const std::string& track = "░") -> std::string;

} // namespace seagreen::util
