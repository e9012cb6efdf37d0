#pragma once

#include <string>
#include <vector>

namespace sonitor::app { class Settings; }

namespace sonitor::ui {

enum class Action {
  None,
  Quit,
  CycleStyle,       // global visualization style
  CycleLayout,
  CycleTheme,
  SelectTile,       // KeyAction::tile holds the 0-based index
  CycleTileStyle,
  ResetTileStyle,
  MoveTileLeft,
  MoveTileRight,
  ToggleAutostart,
  ToggleHelp,
};

struct KeyAction {
  Action action{Action::None};
  int tile{-1};
};

// Interactive state that lives only for the session.
struct WidgetState {
  int selected{-1};
  bool show_help{false};
  bool quit{false};
  std::string status;
};

[[nodiscard]] KeyAction map_key(unsigned char c);

// Wait up to timeout_ms for stdin to become readable.
bool has_input_available(int timeout_ms);

// Map a chunk of terminal input to actions. Escape sequences (arrows,
// function keys, mouse reports) are skipped whole.
[[nodiscard]] std::vector<KeyAction> parse_keys(const unsigned char* buf, size_t n);

// Drain pending keys (non-blocking) into actions.
[[nodiscard]] std::vector<KeyAction> read_actions();

// Apply one action to the session state and the persisted settings.
void apply_action(const KeyAction& a, WidgetState& st, sonitor::app::Settings& s);

} // namespace sonitor::ui
