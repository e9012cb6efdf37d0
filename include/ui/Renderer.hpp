#pragma once

#include <string>
#include <vector>
#include "model/Widget.hpp"
#include "ui/HealthColor.hpp"
#include "ui/Tiles.hpp"

namespace sonitor::app { class Settings; }

namespace sonitor::ui {

// Everything a frame needs, captured by value once per tick.
struct WidgetFrame {
  sonitor::model::Layout layout{sonitor::model::Layout::Compact};
  sonitor::model::VisMode global_mode{sonitor::model::VisMode::Bar};
  Theme theme;
  std::vector<TileView> tiles;   // display order
  bool autostart{false};
  bool show_help{false};
  std::string status;            // transient message under the tiles
};

// Snapshot of the settings; `selected` is an index into the tile order
// (-1 for none).
[[nodiscard]] WidgetFrame make_frame(const sonitor::app::Settings& s, int selected, bool show_help);

// Widget width in columns for a layout: reference pixel width / 8,
// limited to `max_cols`.
[[nodiscard]] int widget_cols(sonitor::model::Layout l, int max_cols);

// Box drawing
std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines,
                                  int width, int min_height = 0);

// Complete widget: title box with the tile grid, then the key hint line
// (or the help block). With max_rows > 0 the result never has more lines:
// the footer goes first, then graphic tiles fall back to Minimal.
[[nodiscard]] std::vector<std::string> render_widget(const WidgetFrame& f, const sonitor::model::TileReadings& r,
                                                     int max_cols, int max_rows = 0);

// Draw a frame at the top-left of the terminal, clearing what is below.
// No newline follows the last line so a full-height frame does not scroll.
void present(const std::vector<std::string>& lines);

[[nodiscard]] std::vector<std::string> help_lines();

} // namespace sonitor::ui
