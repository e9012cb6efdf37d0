#include "ui/Input.hpp"
#include "app/Autostart.hpp"
#include "app/Settings.hpp"
#include "ui/HealthColor.hpp"
#include "util/Log.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>

namespace sonitor::ui {

using sonitor::model::TileId;

bool has_input_available(int timeout_ms) {
  struct pollfd pfd{.fd=STDIN_FILENO,.events=POLLIN,.revents=0};
  int to = std::clamp(timeout_ms, 0, 5000);
  int rv = ::poll(&pfd, 1, to);
  return rv > 0 && (pfd.revents & POLLIN);
}

KeyAction map_key(unsigned char c) {
  switch (c) {
    case 'q': case 'Q': return {Action::Quit};
    case 'v': case 'V': return {Action::CycleStyle};
    case 'l': case 'L': return {Action::CycleLayout};
    case 't': case 'T': return {Action::CycleTheme};
    case 'm': case 'M': return {Action::CycleTileStyle};
    case 'r': case 'R': return {Action::ResetTileStyle};
    case '[':           return {Action::MoveTileLeft};
    case ']':           return {Action::MoveTileRight};
    case 'a': case 'A': return {Action::ToggleAutostart};
    case 'h': case 'H': case '?': return {Action::ToggleHelp};
    default: break;
  }
  if (c >= '1' && c <= '8') return {Action::SelectTile, c - '1'};
  return {};
}

// Length of the escape sequence starting at buf[0] == ESC.
static size_t escape_len(const unsigned char* buf, size_t n) {
  if (n < 2) return n;
  if (buf[1] == 'O') return std::min<size_t>(3, n);       // SS3: ESC O P
  if (buf[1] != '[') return 2;                              // Alt+key
  size_t i = 2;
  while (i < n && buf[i] >= 0x20 && buf[i] <= 0x3F) ++i;    // params, intermediates
  if (i >= n) return n;
  // X10 mouse report: ESC [ M b x y
  if (buf[i] == 'M' && i == 2) return std::min(n, i + 4);
  return i + 1;
}

std::vector<KeyAction> parse_keys(const unsigned char* buf, size_t n) {
  std::vector<KeyAction> out;
  for (size_t k = 0; k < n;) {
    if (buf[k] == 0x1B) { k += escape_len(buf + k, n - k); continue; } // arrows, mouse: unbound
    auto a = map_key(buf[k]);
    if (a.action != Action::None) out.push_back(a);
    ++k;
  }
  return out;
}

std::vector<KeyAction> read_actions() {
  unsigned char buf[32];
  ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n <= 0) return {};
  return parse_keys(buf, static_cast<size_t>(n));
}

static bool selected_tile(const WidgetState& st, const sonitor::app::Settings& s, TileId& out) {
  auto order = s.tile_order();
  if (st.selected < 0 || st.selected >= static_cast<int>(order.size())) return false;
  out = order[static_cast<size_t>(st.selected)];
  return true;
}

static void move_selected(WidgetState& st, sonitor::app::Settings& s, int delta) {
  TileId cur{};
  if (!selected_tile(st, s, cur)) { st.status = "select a tile with 1-8 first"; return; }
  auto order = s.tile_order();
  int target = st.selected + delta;
  if (target < 0 || target >= static_cast<int>(order.size())) return;
  if (s.swap_tiles(cur, order[static_cast<size_t>(target)], s.layout())) st.selected = target;
}

void apply_action(const KeyAction& a, WidgetState& st, sonitor::app::Settings& s) {
  st.status.clear();
  switch (a.action) {
    case Action::None:
      return;
    case Action::Quit:
      st.quit = true;
      return;
    case Action::CycleStyle:
      s.set_vis_mode(sonitor::model::next_mode(s.vis_mode()));
      return;
    case Action::CycleLayout:
      s.set_layout(sonitor::model::next_layout(s.layout()));
      st.selected = -1;
      return;
    case Action::CycleTheme:
      (void)s.set_theme(next_theme_name(s.theme_name()));
      return;
    case Action::SelectTile: {
      int count = static_cast<int>(s.tile_order().size());
      if (a.tile >= 0 && a.tile < count) st.selected = (st.selected == a.tile) ? -1 : a.tile;
      return;
    }
    case Action::CycleTileStyle: {
      TileId t{};
      if (!selected_tile(st, s, t)) { st.status = "select a tile with 1-8 first"; return; }
      auto m = s.cycle_tile_mode(t);
      st.status = std::string(sonitor::model::tile_label(t)) + ": " + sonitor::model::to_string(m);
      return;
    }
    case Action::ResetTileStyle: {
      TileId t{};
      if (!selected_tile(st, s, t)) { st.status = "select a tile with 1-8 first"; return; }
      s.reset_tile_mode(t);
      st.status = std::string(sonitor::model::tile_label(t)) + ": global style";
      return;
    }
    case Action::MoveTileLeft:
      move_selected(st, s, -1);
      return;
    case Action::MoveTileRight:
      move_selected(st, s, +1);
      return;
    case Action::ToggleAutostart: {
      bool want = !s.autostart();
      if (!sonitor::app::set_autostart(want)) {
        st.status = "autostart: update failed (see log)";
        return;
      }
      s.set_autostart(want);
      st.status = want ? "autostart enabled" : "autostart disabled";
      sonitor::util::log_info("Input", "%s", st.status.c_str());
      return;
    }
    case Action::ToggleHelp:
      st.show_help = !st.show_help;
      return;
  }
}

} // namespace sonitor::ui
