#include "minitest.hpp"
#include "fixture.hpp"
#include "app/Autostart.hpp"
#include "app/Settings.hpp"
#include "ui/Input.hpp"

using namespace sonitor::model;
using sonitor::ui::Action;
using sonitor::ui::KeyAction;
using sonitor::ui::WidgetState;

TEST(key_bindings) {
  ASSERT_TRUE(sonitor::ui::map_key('q').action == Action::Quit);
  ASSERT_TRUE(sonitor::ui::map_key('v').action == Action::CycleStyle);
  ASSERT_TRUE(sonitor::ui::map_key('L').action == Action::CycleLayout);
  ASSERT_TRUE(sonitor::ui::map_key('t').action == Action::CycleTheme);
  ASSERT_TRUE(sonitor::ui::map_key('m').action == Action::CycleTileStyle);
  ASSERT_TRUE(sonitor::ui::map_key('r').action == Action::ResetTileStyle);
  ASSERT_TRUE(sonitor::ui::map_key('[').action == Action::MoveTileLeft);
  ASSERT_TRUE(sonitor::ui::map_key(']').action == Action::MoveTileRight);
  ASSERT_TRUE(sonitor::ui::map_key('a').action == Action::ToggleAutostart);
  ASSERT_TRUE(sonitor::ui::map_key('h').action == Action::ToggleHelp);
  auto sel = sonitor::ui::map_key('3');
  ASSERT_TRUE(sel.action == Action::SelectTile);
  ASSERT_EQ(sel.tile, 2);
  ASSERT_TRUE(sonitor::ui::map_key('9').action == Action::None);
  ASSERT_TRUE(sonitor::ui::map_key('x').action == Action::None);
}

static std::vector<KeyAction> keys(const std::string& in) {
  return sonitor::ui::parse_keys(reinterpret_cast<const unsigned char*>(in.data()), in.size());
}

TEST(escape_sequences_skipped_keys_kept) {
  // up arrow between two keys; 'A' alone would toggle autostart
  auto a = keys("v\x1B[Aq");
  ASSERT_EQ(a.size(), 2u);
  ASSERT_TRUE(a[0].action == Action::CycleStyle);
  ASSERT_TRUE(a[1].action == Action::Quit);
  // CSI with parameters, SS3 arrow, X10 mouse report, Alt+q
  auto b = keys("\x1B[1;5C" "\x1BOB" "2" "\x1B[M !!" "t" "\x1Bq" "h");
  ASSERT_EQ(b.size(), 3u);
  ASSERT_TRUE(b[0].action == Action::SelectTile);
  ASSERT_EQ(b[0].tile, 1);
  ASSERT_TRUE(b[1].action == Action::CycleTheme);
  ASSERT_TRUE(b[2].action == Action::ToggleHelp);
  ASSERT_TRUE(keys("\x1B").empty());
  ASSERT_TRUE(keys("\x1B[").empty());
}

TEST(actions_cycle_global_state) {
  FakeRoot root("input_cycle");
  sonitor::app::Settings s((root.path() / "config.toml").string());
  WidgetState st;
  sonitor::ui::apply_action({Action::CycleStyle}, st, s);
  ASSERT_TRUE(s.vis_mode() == VisMode::Gauge);
  sonitor::ui::apply_action({Action::CycleTheme}, st, s);
  ASSERT_EQ(s.theme_name(), std::string("ocean"));
  st.selected = 2;
  sonitor::ui::apply_action({Action::CycleLayout}, st, s);
  ASSERT_TRUE(s.layout() == Layout::Wide);
  ASSERT_EQ(st.selected, -1);
  sonitor::ui::apply_action({Action::ToggleHelp}, st, s);
  ASSERT_TRUE(st.show_help);
  sonitor::ui::apply_action({Action::Quit}, st, s);
  ASSERT_TRUE(st.quit);
}

TEST(actions_need_a_selected_tile) {
  FakeRoot root("input_select");
  sonitor::app::Settings s((root.path() / "config.toml").string());
  WidgetState st;
  sonitor::ui::apply_action({Action::CycleTileStyle}, st, s);
  ASSERT_TRUE(!st.status.empty());
  ASSERT_TRUE(!s.has_tile_override(TileId::Cpu));
  // mini shows three tiles; 5 is out of range
  s.set_layout(Layout::Mini);
  sonitor::ui::apply_action({Action::SelectTile, 4}, st, s);
  ASSERT_EQ(st.selected, -1);
  sonitor::ui::apply_action({Action::SelectTile, 1}, st, s);
  ASSERT_EQ(st.selected, 1);
  sonitor::ui::apply_action({Action::CycleTileStyle}, st, s);
  ASSERT_TRUE(s.tile_mode(TileId::Ram) == VisMode::Gauge);
  ASSERT_EQ(st.status, std::string("RAM: gauge"));
  sonitor::ui::apply_action({Action::ResetTileStyle}, st, s);
  ASSERT_TRUE(!s.has_tile_override(TileId::Ram));
  // same key again clears the selection
  sonitor::ui::apply_action({Action::SelectTile, 1}, st, s);
  ASSERT_EQ(st.selected, -1);
}

TEST(actions_move_selected_tile) {
  FakeRoot root("input_move");
  sonitor::app::Settings s((root.path() / "config.toml").string());
  s.set_layout(Layout::Mini);
  WidgetState st;
  sonitor::ui::apply_action({Action::SelectTile, 0}, st, s);
  sonitor::ui::apply_action({Action::MoveTileLeft}, st, s);
  ASSERT_EQ(st.selected, 0);
  sonitor::ui::apply_action({Action::MoveTileRight}, st, s);
  ASSERT_EQ(st.selected, 1);
  auto order = s.tile_order();
  ASSERT_TRUE(order[0] == TileId::Ram);
  ASSERT_TRUE(order[1] == TileId::Cpu);
  sonitor::ui::apply_action({Action::MoveTileRight}, st, s);
  sonitor::ui::apply_action({Action::MoveTileRight}, st, s);
  ASSERT_EQ(st.selected, 2);
  ASSERT_TRUE(s.tile_order()[2] == TileId::Cpu);
}

TEST(actions_toggle_autostart) {
  FakeRoot root("input_autostart");
  ScopedEnv xdg("XDG_CONFIG_HOME", (root.path() / "config").string());
  sonitor::app::Settings s((root.path() / "config" / "sonitor" / "config.toml").string());
  WidgetState st;
  sonitor::ui::apply_action({Action::ToggleAutostart}, st, s);
  ASSERT_TRUE(s.autostart());
  ASSERT_TRUE(sonitor::app::autostart_installed());
  sonitor::ui::apply_action({Action::ToggleAutostart}, st, s);
  ASSERT_TRUE(!s.autostart());
  ASSERT_TRUE(!sonitor::app::autostart_installed());
}
