#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sonitor::model {

enum class VisMode { Bar, Gauge, Arc, Ring, Minimal };
enum class Layout { Compact, Wide, Vertical, Mini };
enum class TileId { Cpu, Ram, Swap, Gpu, Vram, Disk, Net, Temp };

inline constexpr std::array<VisMode, 5> kAllModes{VisMode::Bar, VisMode::Gauge, VisMode::Arc, VisMode::Ring, VisMode::Minimal};
inline constexpr std::array<Layout, 4> kAllLayouts{Layout::Compact, Layout::Wide, Layout::Vertical, Layout::Mini};
inline constexpr std::array<TileId, 8> kAllTiles{TileId::Cpu, TileId::Ram, TileId::Swap, TileId::Gpu,
                                                 TileId::Vram, TileId::Disk, TileId::Net, TileId::Temp};

[[nodiscard]] const char* to_string(VisMode m);
[[nodiscard]] const char* to_string(Layout l);
[[nodiscard]] const char* to_string(TileId t);

[[nodiscard]] std::optional<VisMode> parse_vis_mode(std::string_view s);
[[nodiscard]] std::optional<Layout> parse_layout(std::string_view s);
[[nodiscard]] std::optional<TileId> parse_tile(std::string_view s);

// bar -> gauge -> arc -> ring -> minimal -> bar
[[nodiscard]] VisMode next_mode(VisMode m);
// compact -> wide -> vertical -> mini -> compact
[[nodiscard]] Layout next_layout(Layout l);

// Gauge, arc and ring draw on a dot canvas.
[[nodiscard]] bool is_graphic(VisMode m);

// Disk and Net show two byte rates instead of a percentage.
[[nodiscard]] bool is_io_tile(TileId t);
[[nodiscard]] const char* tile_label(TileId t);  // "CPU", "RAM", ...
[[nodiscard]] const char* tile_unit(TileId t);   // "%" or "°C"

// Tiles a layout shows, in their default order.
[[nodiscard]] const std::vector<TileId>& default_order(Layout l);
// Tiles per row on screen; Vertical is a single column.
[[nodiscard]] int tiles_per_row(Layout l);

struct WindowSize { int width{}; int height{}; };
// Reference pixel size of the desktop window this layout mirrors.
[[nodiscard]] WindowSize reference_size(Layout l, VisMode global_mode);

// "cpu,ram,gpu" <-> order. Unknown and repeated names are dropped.
[[nodiscard]] std::vector<TileId> parse_order(std::string_view csv);
[[nodiscard]] std::string join_order(const std::vector<TileId>& order);

// One tile's display values.
struct TileReading {
  double percent{0.0};      // value for percentage tiles (°C for Temp)
  std::string details;      // secondary text: "3200MHz", "5.1/15.5G", "N/A"
  double read_bps{0.0};     // I/O tiles: disk read / net download
  double write_bps{0.0};    // I/O tiles: disk write / net upload
  bool available{true};
};

using TileReadings = std::array<TileReading, kAllTiles.size()>;

[[nodiscard]] constexpr size_t tile_index(TileId t) { return static_cast<size_t>(t); }

} // namespace sonitor::model
