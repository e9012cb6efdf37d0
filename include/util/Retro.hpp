#pragma once
#include <string>

namespace sonitor::util {

// Block progress bar of exactly `width` cells: filled part first in
// `fill_sgr`, remainder in `track_sgr`. pct is clamped to 0..100. The SGR
// strings may be empty (no color).
auto retro_bar(double pct, int width, const std::string& fill_sgr, const std::string& track_sgr,
               const std::string& fill = "█", const std::string& track = "░") -> std::string;

} // namespace sonitor::util
