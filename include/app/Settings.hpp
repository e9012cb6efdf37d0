#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "model/Widget.hpp"
#include "ui/HealthColor.hpp"
#include "util/TomlReader.hpp"

namespace sonitor::app {

// Persisted widget preferences backed by config.toml. Every mutation is
// written back immediately once autosave is on; a failed write is logged
// and the in-memory state stays authoritative.
class Settings {
public:
  Settings() = default;
  explicit Settings(std::string path) : path_(std::move(path)) {}

  // Seed layout/style/theme from SONITOR_LAYOUT, SONITOR_VIS_MODE and
  // SONITOR_THEME when valid. Call before load() so the file wins.
  void apply_env_defaults();

  // Read the file; missing or invalid entries keep env/compiled defaults.
  // Returns false when the file could not be read.
  bool load();
  bool save() const;

  void set_autosave(bool on) { autosave_ = on; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] const sonitor::util::TomlReader& document() const { return doc_; }

  [[nodiscard]] sonitor::model::Layout layout() const { return layout_; }
  void set_layout(sonitor::model::Layout l);

  [[nodiscard]] sonitor::model::VisMode vis_mode() const { return vis_mode_; }
  void set_vis_mode(sonitor::model::VisMode m);

  [[nodiscard]] const std::string& theme_name() const { return theme_name_; }
  // Unknown names are rejected and leave the theme unchanged.
  bool set_theme(std::string_view name);
  // Selected built-in theme with any [theme] good/warn/danger overrides.
  [[nodiscard]] sonitor::ui::Theme theme() const;

  [[nodiscard]] bool autostart() const { return autostart_; }
  void set_autostart(bool enabled);

  // Per-tile override, or the global mode.
  [[nodiscard]] sonitor::model::VisMode tile_mode(sonitor::model::TileId t) const;
  [[nodiscard]] bool has_tile_override(sonitor::model::TileId t) const;
  // Choosing the global mode removes the override.
  void set_tile_mode(sonitor::model::TileId t, sonitor::model::VisMode m);
  void reset_tile_mode(sonitor::model::TileId t);
  sonitor::model::VisMode cycle_tile_mode(sonitor::model::TileId t);

  // Stored order limited to the layout's tiles; tiles missing from it are
  // appended in default order.
  [[nodiscard]] std::vector<sonitor::model::TileId> tile_order(sonitor::model::Layout l) const;
  [[nodiscard]] std::vector<sonitor::model::TileId> tile_order() const { return tile_order(layout_); }
  void set_tile_order(const std::vector<sonitor::model::TileId>& order, sonitor::model::Layout l);
  // No-op (false) unless both tiles are shown by the layout.
  bool swap_tiles(sonitor::model::TileId a, sonitor::model::TileId b, sonitor::model::Layout l);

private:
  void persist();

  std::string path_;
  bool autosave_{false};
  sonitor::util::TomlReader doc_;

  sonitor::model::Layout layout_{sonitor::model::Layout::Compact};
  sonitor::model::VisMode vis_mode_{sonitor::model::VisMode::Bar};
  std::string theme_name_{"classic"};
  bool autostart_{false};
  std::array<std::optional<sonitor::model::VisMode>, sonitor::model::kAllTiles.size()> tile_modes_{};
  std::array<std::vector<sonitor::model::TileId>, sonitor::model::kAllLayouts.size()> orders_{};
};

} // namespace sonitor::app
