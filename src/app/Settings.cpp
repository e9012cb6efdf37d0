#include "app/Settings.hpp"
#include "ui/Config.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace sonitor::app {

using sonitor::model::Layout;
using sonitor::model::TileId;
using sonitor::model::VisMode;

static size_t layout_index(Layout l) { return static_cast<size_t>(l); }

bool Settings::load() {
  sonitor::util::TomlReader toml;
  if (path_.empty() || !toml.load(path_)) return false;
  doc_ = toml;

  if (auto l = sonitor::model::parse_layout(doc_.get_string("widget", "layout"))) layout_ = *l;
  if (auto m = sonitor::model::parse_vis_mode(doc_.get_string("widget", "vis_mode"))) vis_mode_ = *m;
  if (auto t = sonitor::ui::find_theme(doc_.get_string("widget", "theme"))) theme_name_ = t->name;
  autostart_ = doc_.get_bool("widget", "autostart", autostart_);

  for (const auto& [key, val] : doc_.entries("tiles")) {
    auto tile = sonitor::model::parse_tile(key);
    auto mode = sonitor::model::parse_vis_mode(val);
    if (!tile || !mode) {
      sonitor::util::log_info("Settings", "ignoring [tiles] %s = %s", key.c_str(), val.c_str());
      continue;
    }
    tile_modes_[sonitor::model::tile_index(*tile)] = *mode;
  }
  for (const auto& [key, val] : doc_.entries("order")) {
    auto layout = sonitor::model::parse_layout(key);
    if (!layout) continue;
    orders_[layout_index(*layout)] = sonitor::model::parse_order(val);
  }
  return true;
}

bool Settings::save() const {
  if (path_.empty()) return false;
  std::error_code ec;
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  if (ec) {
    sonitor::util::log_warn("Settings", "cannot create %s: %s", parent.c_str(), ec.message().c_str());
    return false;
  }
  if (!doc_.save(path_)) {
    sonitor::util::log_warn("Settings", "failed to write %s", path_.c_str());
    return false;
  }
  return true;
}

void Settings::persist() {
  if (!autosave_) return;
  (void)save(); // reported by save(); state stays in memory
}

void Settings::set_layout(Layout l) {
  layout_ = l;
  doc_.set("widget", "layout", sonitor::model::to_string(l));
  persist();
}

void Settings::set_vis_mode(VisMode m) {
  vis_mode_ = m;
  doc_.set("widget", "vis_mode", sonitor::model::to_string(m));
  persist();
}

bool Settings::set_theme(std::string_view name) {
  auto t = sonitor::ui::find_theme(name);
  if (!t) return false;
  theme_name_ = t->name;
  doc_.set("widget", "theme", theme_name_);
  persist();
  return true;
}

sonitor::ui::Theme Settings::theme() const {
  auto t = sonitor::ui::find_theme(theme_name_).value_or(sonitor::ui::default_theme());
  if (auto c = sonitor::ui::parse_hex_rgb(doc_.get_string("theme", "good"))) t.good = *c;
  if (auto c = sonitor::ui::parse_hex_rgb(doc_.get_string("theme", "warn"))) t.warn = *c;
  if (auto c = sonitor::ui::parse_hex_rgb(doc_.get_string("theme", "danger"))) t.danger = *c;
  return t;
}

void Settings::set_autostart(bool enabled) {
  autostart_ = enabled;
  doc_.set("widget", "autostart", enabled);
  persist();
}

VisMode Settings::tile_mode(TileId t) const {
  return tile_modes_[sonitor::model::tile_index(t)].value_or(vis_mode_);
}

bool Settings::has_tile_override(TileId t) const {
  return tile_modes_[sonitor::model::tile_index(t)].has_value();
}

void Settings::set_tile_mode(TileId t, VisMode m) {
  if (m == vis_mode_) {
    reset_tile_mode(t);
    return;
  }
  tile_modes_[sonitor::model::tile_index(t)] = m;
  doc_.set("tiles", sonitor::model::to_string(t), sonitor::model::to_string(m));
  persist();
}

void Settings::reset_tile_mode(TileId t) {
  tile_modes_[sonitor::model::tile_index(t)].reset();
  doc_.erase("tiles", sonitor::model::to_string(t));
  persist();
}

VisMode Settings::cycle_tile_mode(TileId t) {
  auto next = sonitor::model::next_mode(tile_mode(t));
  set_tile_mode(t, next);
  return next;
}

std::vector<TileId> Settings::tile_order(Layout l) const {
  const auto& allowed = sonitor::model::default_order(l);
  const auto& stored = orders_[layout_index(l)];
  std::vector<TileId> out;
  for (auto t : stored)
    if (std::find(allowed.begin(), allowed.end(), t) != allowed.end()) out.push_back(t);
  for (auto t : allowed)
    if (std::find(out.begin(), out.end(), t) == out.end()) out.push_back(t);
  return out;
}

void Settings::set_tile_order(const std::vector<TileId>& order, Layout l) {
  std::vector<TileId> clean;
  for (auto t : order)
    if (std::find(clean.begin(), clean.end(), t) == clean.end()) clean.push_back(t);
  orders_[layout_index(l)] = clean;
  doc_.set("order", sonitor::model::to_string(l), sonitor::model::join_order(clean));
  persist();
}

bool Settings::swap_tiles(TileId a, TileId b, Layout l) {
  if (a == b) return false;
  auto order = tile_order(l);
  auto ia = std::find(order.begin(), order.end(), a);
  auto ib = std::find(order.begin(), order.end(), b);
  if (ia == order.end() || ib == order.end()) return false;
  std::iter_swap(ia, ib);
  set_tile_order(order, l);
  return true;
}

void Settings::apply_env_defaults() {
  if (const char* v = sonitor::ui::getenv_compat("SONITOR_LAYOUT"))
    if (auto l = sonitor::model::parse_layout(v)) layout_ = *l;
  if (const char* v = sonitor::ui::getenv_compat("SONITOR_VIS_MODE"))
    if (auto m = sonitor::model::parse_vis_mode(v)) vis_mode_ = *m;
  if (const char* v = sonitor::ui::getenv_compat("SONITOR_THEME"))
    if (auto t = sonitor::ui::find_theme(v)) theme_name_ = t->name;
}

} // namespace sonitor::app
