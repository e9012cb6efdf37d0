#pragma once

#include <string>

namespace sonitor::ui {

// UTF-8 text width utilities (ANSI SGR sequences count as zero columns)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);
std::string center_pad(const std::string& s, int w);
std::string lr_align(int iw, const std::string& left, const std::string& right);

// Byte rate with a 1024 base: "512 B/s", "1.5 KB/s", "3.2 MB/s", "1.0 GB/s".
// Negative and NaN input reads as 0.
[[nodiscard]] std::string format_byte_rate(double bytes_per_second);

// Tile value text: rounded to 0 decimals followed by the unit ("42%", "67°C").
[[nodiscard]] std::string format_tile_value(double value, const std::string& unit);

} // namespace sonitor::ui
