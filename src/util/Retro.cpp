#include "util/Retro.hpp"
#include <algorithm>
#include <cmath>

namespace seagreen::util {

auto retro_bar(double pct, int width, const std::string& fill, const std::string& track) -> std::string {
  if (width < 1) width = 1;
  pct = std::isnan(pct) ? 0.0 : std::clamp(pct, 0.0, 100.0);
  int filled = static_cast<int>(std::round((pct / 100.0) * width));
  if (filled > width) filled = width;
  std::string s;
  s.reserve(static_cast<size_t>(width) * fill.size() + 2);
  s.push_back('[');
  for (int i = 0; i < width; ++i) {
    if (i < filled) s += fill; else s += track;
  }
  s.push_back(']');
  return s;
}

} // namespace seagreen::util
