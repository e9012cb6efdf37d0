#include "ui/Tiles.hpp"
#include "ui/Canvas.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include "util/Retro.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace sonitor::ui {

using sonitor::model::TileId;
using sonitor::model::TileReading;
using sonitor::model::VisMode;

namespace {

constexpr int kCanvasRows = 4;
constexpr double kPi = std::numbers::pi;

double clamp_pct(double v) {
  if (std::isnan(v)) return 0.0;
  return std::clamp(v, 0.0, 100.0);
}

std::string colored(const std::string& s, const Rgb& c) {
  return sgr_fg(c) + s + sgr_reset();
}

std::string label_text(const TileView& v) {
  std::string label = sonitor::model::tile_label(v.id);
  if (v.selected) return sgr_reverse() + label + sgr_reset();
  return colored(label, kLabelColor);
}

std::string value_text(const TileView& v, const TileReading& r) {
  return format_tile_value(r.percent, sonitor::model::tile_unit(v.id));
}

// Canvas block plus a centered label line.
std::vector<std::string> finish_canvas(const TileView& v, const Canvas& cv, int width) {
  std::vector<std::string> out;
  for (auto& ln : cv.lines()) out.push_back(trunc_pad(ln, width));
  out.push_back(center_pad(label_text(v), width));
  return out;
}

} // namespace

int tile_height(TileId id, VisMode mode) {
  if (sonitor::model::is_io_tile(id)) return 3;
  switch (mode) {
    case VisMode::Bar:     return 3;
    case VisMode::Gauge:
    case VisMode::Arc:
    case VisMode::Ring:    return kCanvasRows + 1;
    case VisMode::Minimal: return 2;
  }
  return 3;
}

std::vector<std::string> render_bar_tile(const TileView& v, const TileReading& r, const Theme& theme, int width) {
  auto color = map_percent_to_color(r.percent, theme);
  const bool uni = use_unicode();
  std::vector<std::string> out;
  out.push_back(lr_align(width, label_text(v), colored(value_text(v, r), color)));
  out.push_back(sonitor::util::retro_bar(clamp_pct(r.percent), width, sgr_fg(color), sgr_fg(kTrackColor),
                                         uni ? "█" : "#", uni ? "░" : "-"));
  out.push_back(trunc_pad(colored(r.details, kLabelColor), width));
  return out;
}

// 252 degree dial from 0.8pi to 2.2pi with a needle at the value.
std::vector<std::string> render_gauge_tile(const TileView& v, const TileReading& r, const Theme& theme, int width) {
  Canvas cv(width, kCanvasRows);
  const double w = cv.width(), h = cv.height();
  const double cx = w / 2.0, cy = h * 0.55;
  const double rad = std::min(w * 0.4, h * 0.45);
  const double pct = clamp_pct(r.percent);
  const double a0 = 0.8 * kPi, a1 = 2.2 * kPi;
  const double av = a0 + (pct / 100.0) * (a1 - a0);
  auto color = map_percent_to_color(pct, theme);

  cv.arc(cx, cy, rad, a0, a1, kTrackColor, 2);
  if (pct > 0.0) cv.arc(cx, cy, rad, a0, av, color, 2);
  const double nl = rad * 0.75;
  cv.line(static_cast<int>(std::lround(cx)), static_cast<int>(std::lround(cy)),
          static_cast<int>(std::lround(cx + nl * std::cos(av))),
          static_cast<int>(std::lround(cy + nl * std::sin(av))), kNeedleColor);
  cv.disc(cx, cy, 1.0, kNeedleColor);
  cv.text_centered(kCanvasRows - 1, value_text(v, r), color);
  return finish_canvas(v, cv, width);
}

// Half circle from pi to 2pi (left to right over the top).
std::vector<std::string> render_arc_tile(const TileView& v, const TileReading& r, const Theme& theme, int width) {
  Canvas cv(width, kCanvasRows);
  const double w = cv.width(), h = cv.height();
  const double cx = w / 2.0, cy = h * 0.8;
  const double rad = std::min(w * 0.45, h * 0.7);
  const double pct = clamp_pct(r.percent);
  auto color = map_percent_to_color(pct, theme);

  cv.arc(cx, cy, rad, kPi, 2.0 * kPi, kTrackColor, 2);
  if (pct > 0.0) cv.arc(cx, cy, rad, kPi, kPi + (pct / 100.0) * kPi, color, 2);
  cv.text_centered(kCanvasRows - 2, value_text(v, r), color);
  return finish_canvas(v, cv, width);
}

// Full ring filled clockwise from 12 o'clock; the value has no unit.
std::vector<std::string> render_ring_tile(const TileView& v, const TileReading& r, const Theme& theme, int width) {
  Canvas cv(width, kCanvasRows);
  const double w = cv.width(), h = cv.height();
  const double cx = w / 2.0, cy = h / 2.0;
  const double rad = std::min(w, h) * 0.42;
  const double pct = clamp_pct(r.percent);
  auto color = map_percent_to_color(pct, theme);
  const double start = -kPi / 2.0;

  cv.arc(cx, cy, rad, start, start + 2.0 * kPi, kTrackColor, 2);
  if (pct > 0.0) cv.arc(cx, cy, rad, start, start + (pct / 100.0) * 2.0 * kPi, color, 2);
  cv.text_centered(kCanvasRows / 2, format_tile_value(r.percent, ""), color);
  return finish_canvas(v, cv, width);
}

std::vector<std::string> render_minimal_tile(const TileView& v, const TileReading& r, const Theme& theme, int width) {
  auto color = map_percent_to_color(r.percent, theme);
  return {
    center_pad(label_text(v), width),
    center_pad(sgr_bold() + colored(value_text(v, r), color), width),
  };
}

std::vector<std::string> render_io_tile(const TileView& v, const TileReading& r, const Theme& theme, int width) {
  const bool uni = use_unicode();
  std::string down = std::string(uni ? "↓ " : "v ") + format_byte_rate(r.read_bps);
  std::string up = std::string(uni ? "↑ " : "^ ") + format_byte_rate(r.write_bps);
  return {
    trunc_pad(label_text(v), width),
    trunc_pad(colored(down, theme.good), width),
    trunc_pad(colored(up, theme.warn), width),
  };
}

std::vector<std::string> render_tile(const TileView& v, const TileReading& r, const Theme& theme, int width) {
  if (sonitor::model::is_io_tile(v.id)) return render_io_tile(v, r, theme, width);
  switch (v.mode) {
    case VisMode::Bar:     return render_bar_tile(v, r, theme, width);
    case VisMode::Gauge:   return render_gauge_tile(v, r, theme, width);
    case VisMode::Arc:     return render_arc_tile(v, r, theme, width);
    case VisMode::Ring:    return render_ring_tile(v, r, theme, width);
    case VisMode::Minimal: return render_minimal_tile(v, r, theme, width);
  }
  return render_bar_tile(v, r, theme, width);
}

} // namespace sonitor::ui
