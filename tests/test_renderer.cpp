#include "minitest.hpp"
#include "fixture.hpp"
#include "app/Settings.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"

using namespace sonitor::model;

static bool contains(const std::vector<std::string>& lines, const std::string& needle) {
  for (const auto& ln : lines)
    if (ln.find(needle) != std::string::npos) return true;
  return false;
}

TEST(widget_width_from_reference_size) {
  ASSERT_EQ(sonitor::ui::widget_cols(Layout::Compact, 200), 60);
  ASSERT_EQ(sonitor::ui::widget_cols(Layout::Wide, 200), 50);
  ASSERT_EQ(sonitor::ui::widget_cols(Layout::Vertical, 200), 16);
  ASSERT_EQ(sonitor::ui::widget_cols(Layout::Compact, 40), 40);
}

TEST(frame_follows_settings_order_and_modes) {
  FakeRoot root("frame");
  sonitor::app::Settings s((root.path() / "config.toml").string());
  s.set_layout(Layout::Mini);
  s.set_tile_mode(TileId::Ram, VisMode::Ring);
  ASSERT_TRUE(s.swap_tiles(TileId::Cpu, TileId::Gpu, Layout::Mini));
  auto f = sonitor::ui::make_frame(s, 1, false);
  ASSERT_EQ(f.tiles.size(), 3u);
  ASSERT_TRUE(f.tiles[0].id == TileId::Gpu);
  ASSERT_TRUE(f.tiles[1].id == TileId::Ram);
  ASSERT_TRUE(f.tiles[1].mode == VisMode::Ring);
  ASSERT_TRUE(f.tiles[1].selected);
  ASSERT_TRUE(!f.tiles[0].selected);
  ASSERT_TRUE(f.tiles[2].mode == VisMode::Bar);
}

TEST(widget_lines_share_one_width) {
  ScopedEnv lang("LC_ALL", "C.UTF-8");
  FakeRoot root("widget");
  sonitor::app::Settings s((root.path() / "config.toml").string());
  TileReadings r{};
  r[tile_index(TileId::Cpu)].percent = 12.0;
  r[tile_index(TileId::Net)].read_bps = 4096.0;
  for (auto layout : kAllLayouts) {
    s.set_layout(layout);
    for (auto mode : kAllModes) {
      s.set_vis_mode(mode);
      auto f = sonitor::ui::make_frame(s, -1, false);
      int width = sonitor::ui::widget_cols(layout, 120);
      auto lines = sonitor::ui::render_widget(f, r, 120);
      ASSERT_TRUE(lines.size() > 3);
      for (const auto& ln : lines) ASSERT_EQ(sonitor::ui::display_cols(ln), width);
      ASSERT_TRUE(lines.front().find("Sonitor") != std::string::npos);
    }
  }
}

TEST(widget_shows_state_and_hints) {
  ScopedEnv lang("LC_ALL", "C.UTF-8");
  FakeRoot root("widget_info");
  sonitor::app::Settings s((root.path() / "config.toml").string());
  ASSERT_TRUE(s.set_theme("ocean"));
  TileReadings r{};
  r[tile_index(TileId::Disk)].write_bps = 3.0 * 1024.0 * 1024.0;
  auto f = sonitor::ui::make_frame(s, -1, false);
  f.status = "CPU: gauge";
  auto lines = sonitor::ui::render_widget(f, r, 120);
  ASSERT_TRUE(contains(lines, "compact · bar · ocean"));
  ASSERT_TRUE(contains(lines, "CPU: gauge"));
  ASSERT_TRUE(contains(lines, "3.0 MB/s"));
  ASSERT_TRUE(contains(lines, "h help"));
  f.show_help = true;
  lines = sonitor::ui::render_widget(f, r, 120);
  ASSERT_TRUE(contains(lines, "m tile style"));
}

TEST(widget_fits_terminal_height) {
  ScopedEnv lang("LC_ALL", "C.UTF-8");
  FakeRoot root("widget_rows");
  sonitor::app::Settings s((root.path() / "config.toml").string());
  s.set_layout(Layout::Vertical);
  s.set_vis_mode(VisMode::Gauge);
  TileReadings r{};
  r[tile_index(TileId::Cpu)].percent = 40.0;
  auto f = sonitor::ui::make_frame(s, -1, true);

  auto full = sonitor::ui::render_widget(f, r, 80);
  ASSERT_TRUE(full.size() > 24u);
  ASSERT_TRUE(contains(full, "m tile style"));

  auto fitted = sonitor::ui::render_widget(f, r, 80, 24);
  ASSERT_TRUE(fitted.size() <= 24u);
  ASSERT_TRUE(!contains(fitted, "m tile style"));
  ASSERT_TRUE(contains(fitted, "CPU"));
  ASSERT_TRUE(contains(fitted, "Network"));
  ASSERT_TRUE(fitted.back().find("╯") != std::string::npos);
  for (const auto& ln : fitted) ASSERT_EQ(sonitor::ui::display_cols(ln), sonitor::ui::widget_cols(Layout::Vertical, 80));

  auto tiny = sonitor::ui::render_widget(f, r, 80, 6);
  ASSERT_EQ(tiny.size(), 6u);
  ASSERT_TRUE(tiny.back().find("╯") != std::string::npos);
  ASSERT_EQ(sonitor::ui::render_widget(f, r, 80, 1).size(), 1u);
}

TEST(widget_drops_footer_before_tiles) {
  ScopedEnv lang("LC_ALL", "C.UTF-8");
  FakeRoot root("widget_footer");
  sonitor::app::Settings s((root.path() / "config.toml").string());
  s.set_layout(Layout::Mini);
  TileReadings r{};
  auto f = sonitor::ui::make_frame(s, -1, false);
  auto full = sonitor::ui::render_widget(f, r, 80);
  auto fitted = sonitor::ui::render_widget(f, r, 80, static_cast<int>(full.size()) - 1);
  ASSERT_EQ(fitted.size(), full.size() - 1);
  ASSERT_TRUE(!contains(fitted, "h help"));
  ASSERT_EQ(fitted.front(), full.front());
}

TEST(box_has_borders_and_min_height) {
  ScopedEnv lang("LC_ALL", "C");
  auto box = sonitor::ui::make_box("T", {"a", "b"}, 10, 4);
  ASSERT_EQ(box.size(), 6u);
  ASSERT_TRUE(box.front().find('+') != std::string::npos);
  for (const auto& ln : box) ASSERT_EQ(sonitor::ui::display_cols(ln), 10);
  ASSERT_TRUE(box[1].find('|') != std::string::npos);
  ASSERT_TRUE(box[1].find('a') != std::string::npos);
}
