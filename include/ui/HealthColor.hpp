#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sonitor::ui {

// Linear RGB color, channels in [0,1].
struct Rgb {
  double r{0.0};
  double g{0.0};
  double b{0.0};
  bool operator==(const Rgb&) const = default;
};

// Three-stop health palette.
struct Theme {
  std::string name;
  Rgb good;
  Rgb warn;
  Rgb danger;
};

// A utilization or temperature reading, mapped after clamping to [0,100].
struct HealthSample {
  double percent{0.0};
};

// Health gradient: good up to 50, good->warn over (50,75], warn->danger
// over (75,100]. Out-of-range input is clamped; NaN reads as 0.
[[nodiscard]] Rgb map_percent_to_color(double percent, const Theme& theme) noexcept;
[[nodiscard]] inline Rgb map_percent_to_color(HealthSample s, const Theme& theme) noexcept {
  return map_percent_to_color(s.percent, theme);
}

// Built-in themes
[[nodiscard]] const Theme& default_theme();
[[nodiscard]] std::optional<Theme> find_theme(std::string_view name); // case-insensitive
[[nodiscard]] std::vector<std::string> theme_names();
// Next theme name after `name` in theme_names() order (wraps).
[[nodiscard]] std::string next_theme_name(std::string_view name);

// "#RRGGBB"; channels scaled by 255 and truncated.
[[nodiscard]] std::string rgb_to_hex(const Rgb& c);
// Accepts "#RRGGBB" only.
[[nodiscard]] std::optional<Rgb> parse_hex_rgb(std::string_view hex);

// 0..255 integer channels for terminal output.
struct Rgb8 { int r, g, b; };
[[nodiscard]] Rgb8 to_rgb8(const Rgb& c);

} // namespace sonitor::ui
