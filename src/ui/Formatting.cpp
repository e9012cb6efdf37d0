#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <cmath>
#include <cstdio>
#include <string>

namespace sonitor::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // skip final byte
      continue;
    }
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    // Copy ANSI escape sequences without counting them
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++;
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + (use_unicode()? "…" : ".") + sgr_reset();
}

std::string center_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols >= w) return trunc_pad(s, w);
  int left = (w - cols) / 2;
  return std::string(left, ' ') + s + std::string(w - cols - left, ' ');
}

std::string lr_align(int iw, const std::string& left, const std::string& right){
  if (iw <= 0) return std::string();
  int rvis = display_cols(right);
  int tlw = iw - rvis - 1;
  if (tlw < 0) tlw = 0;
  std::string l = trunc_pad(left, tlw);
  int lvis = display_cols(l);
  int space = iw - lvis - rvis;
  if (space < 0) space = 0;
  return trunc_pad(l + std::string(space, ' ') + right, iw);
}

static std::string printf_string(const char* fmt, double v, const char* unit) {
  int n = std::snprintf(nullptr, 0, fmt, v, unit);
  if (n <= 0) return {};
  std::string out(static_cast<size_t>(n), '\0');
  std::snprintf(out.data(), out.size() + 1, fmt, v, unit);
  return out;
}

std::string format_byte_rate(double bps) {
  if (!std::isfinite(bps) || bps < 0.0) bps = 0.0;
  static const char* units[] = {"KB/s", "MB/s", "GB/s"};
  if (bps < 1024.0) return printf_string("%.0f %s", bps, "B/s");
  double v = bps / 1024.0;
  int u = 0;
  while (u < 2 && v >= 1024.0) { v /= 1024.0; ++u; }
  return printf_string("%.1f %s", v, units[u]);
}

std::string format_tile_value(double value, const std::string& unit) {
  if (!std::isfinite(value)) value = 0.0;
  return printf_string("%.0f%s", value, unit.c_str());
}

} // namespace sonitor::ui
