#include "util/Retro.hpp"
#include <algorithm>
#include <cmath>

namespace sonitor::util {

auto retro_bar(double pct, int width, const std::string& fill_sgr, const std::string& track_sgr,
               const std::string& fill, const std::string& track) -> std::string {
  if (width <= 0) return {};
  if (std::isnan(pct)) pct = 0.0;
  pct = std::clamp(pct, 0.0, 100.0);
  int filled = static_cast<int>(std::round((pct / 100.0) * width));
  if (filled > width) filled = width;
  std::string s;
  s.reserve(static_cast<size_t>(width) * 3 + 32);
  if (filled > 0) {
    s += fill_sgr;
    for (int i = 0; i < filled; ++i) s += fill;
  }
  if (filled < width) {
    s += track_sgr;
    for (int i = filled; i < width; ++i) s += track;
  }
  if (!fill_sgr.empty() || !track_sgr.empty()) s += "\x1B[0m";
  return s;
}

} // namespace sonitor::util
