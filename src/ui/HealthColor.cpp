#include "ui/HealthColor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace sonitor::ui {

namespace {

// a*(1-t) + b*t returns a at t=0 and b at t=1 exactly, so the branches
// below meet bit-for-bit at 50 and 75.
double lerp(double a, double b, double t) { return a * (1.0 - t) + b * t; }

Rgb lerp_rgb(const Rgb& a, const Rgb& b, double t) {
  return Rgb{lerp(a.r, b.r, t), lerp(a.g, b.g, t), lerp(a.b, b.b, t)};
}

constexpr Rgb hex3(int r, int g, int b) {
  return Rgb{r / 255.0, g / 255.0, b / 255.0};
}

const std::array<Theme, 4>& builtin_themes() {
  static const std::array<Theme, 4> themes{{
    {"classic", hex3(0x00, 0xCC, 0x66), hex3(0xFF, 0xAA, 0x00), hex3(0xFF, 0x33, 0x33)},
    {"ocean",   hex3(0x33, 0xBB, 0xFF), hex3(0x99, 0x66, 0xFF), hex3(0xFF, 0x33, 0x99)},
    {"sunset",  hex3(0xFF, 0xDD, 0x55), hex3(0xFF, 0x88, 0x33), hex3(0xDD, 0x22, 0x44)},
    {"mono",    hex3(0xAA, 0xAA, 0xAA), hex3(0xDD, 0xDD, 0xDD), hex3(0xFF, 0xFF, 0xFF)},
  }};
  return themes;
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

int hexv(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Truncating; the epsilon keeps parse_hex_rgb -> rgb_to_hex stable.
int channel255(double v) {
  if (std::isnan(v)) return 0;
  v = std::clamp(v, 0.0, 1.0);
  return std::min(255, static_cast<int>(v * 255.0 + 1e-9));
}

} // namespace

Rgb map_percent_to_color(double percent, const Theme& theme) noexcept {
  if (std::isnan(percent)) percent = 0.0;
  percent = std::clamp(percent, 0.0, 100.0);
  if (percent <= 50.0) return theme.good;
  if (percent <= 75.0) return lerp_rgb(theme.good, theme.warn, (percent - 50.0) / 25.0);
  double t = std::min(1.0, (percent - 75.0) / 25.0);
  return lerp_rgb(theme.warn, theme.danger, t);
}

const Theme& default_theme() { return builtin_themes()[0]; }

std::optional<Theme> find_theme(std::string_view name) {
  for (const auto& t : builtin_themes())
    if (iequals(t.name, name)) return t;
  return std::nullopt;
}

std::vector<std::string> theme_names() {
  std::vector<std::string> out;
  for (const auto& t : builtin_themes()) out.push_back(t.name);
  return out;
}

std::string next_theme_name(std::string_view name) {
  const auto& all = builtin_themes();
  for (size_t i = 0; i < all.size(); ++i)
    if (iequals(all[i].name, name)) return all[(i + 1) % all.size()].name;
  return all[0].name;
}

std::string rgb_to_hex(const Rgb& c) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", channel255(c.r), channel255(c.g), channel255(c.b));
  return buf;
}

std::optional<Rgb> parse_hex_rgb(std::string_view hex) {
  if (hex.size() != 7 || hex[0] != '#') return std::nullopt;
  int v[6];
  for (int i = 0; i < 6; ++i) {
    v[i] = hexv(hex[i + 1]);
    if (v[i] < 0) return std::nullopt;
  }
  return hex3(v[0] * 16 + v[1], v[2] * 16 + v[3], v[4] * 16 + v[5]);
}

Rgb8 to_rgb8(const Rgb& c) {
  return Rgb8{channel255(c.r), channel255(c.g), channel255(c.b)};
}

} // namespace sonitor::ui
