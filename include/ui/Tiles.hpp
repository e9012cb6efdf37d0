#pragma once

#include <string>
#include <vector>
#include "model/Widget.hpp"
#include "ui/HealthColor.hpp"

namespace sonitor::ui {

struct TileView {
  sonitor::model::TileId id{sonitor::model::TileId::Cpu};
  sonitor::model::VisMode mode{sonitor::model::VisMode::Bar};
  bool selected{false};
};

// Fixed palette outside the health gradient
inline constexpr Rgb kTrackColor{0.2, 0.2, 0.2};
inline constexpr Rgb kLabelColor{0.53, 0.53, 0.53};
inline constexpr Rgb kNeedleColor{0.87, 0.87, 0.87};

// Lines a tile occupies for its kind and mode.
[[nodiscard]] int tile_height(sonitor::model::TileId id, sonitor::model::VisMode mode);

// Render one tile as exactly tile_height() lines of `width` columns.
// Disk and Net always use the I/O tile whatever the mode.
[[nodiscard]] std::vector<std::string> render_tile(const TileView& view, const sonitor::model::TileReading& r,
                                                   const Theme& theme, int width);

[[nodiscard]] std::vector<std::string> render_bar_tile(const TileView& view, const sonitor::model::TileReading& r, const Theme& theme, int width);
[[nodiscard]] std::vector<std::string> render_gauge_tile(const TileView& view, const sonitor::model::TileReading& r, const Theme& theme, int width);
[[nodiscard]] std::vector<std::string> render_arc_tile(const TileView& view, const sonitor::model::TileReading& r, const Theme& theme, int width);
[[nodiscard]] std::vector<std::string> render_ring_tile(const TileView& view, const sonitor::model::TileReading& r, const Theme& theme, int width);
[[nodiscard]] std::vector<std::string> render_minimal_tile(const TileView& view, const sonitor::model::TileReading& r, const Theme& theme, int width);
[[nodiscard]] std::vector<std::string> render_io_tile(const TileView& view, const sonitor::model::TileReading& r, const Theme& theme, int width);

} // namespace sonitor::ui
