#include "ui/Renderer.hpp"
#include "app/Settings.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"

#include <unistd.h>

#include <algorithm>

namespace sonitor::ui {

using sonitor::model::Layout;

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(static_cast<size_t>(std::max(0, n * static_cast<int>(ch.size()))));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

WidgetFrame make_frame(const sonitor::app::Settings& s, int selected, bool show_help) {
  WidgetFrame f;
  f.layout = s.layout();
  f.global_mode = s.vis_mode();
  f.theme = s.theme();
  f.autostart = s.autostart();
  f.show_help = show_help;
  int i = 0;
  for (auto id : s.tile_order()) {
    f.tiles.push_back(TileView{id, s.tile_mode(id), i == selected});
    ++i;
  }
  return f;
}

int widget_cols(Layout l, int max_cols) {
  int cols = sonitor::model::reference_size(l, sonitor::model::VisMode::Bar).width / 8;
  cols = std::max(cols, 16);
  return std::max(8, std::min(cols, max_cols));
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines, int width, int min_height) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const bool uni = use_unicode();
  const std::string TL = uni? "╭" : "+";
  const std::string TR = uni? "╮" : "+";
  const std::string BL = uni? "╰" : "+";
  const std::string BR = uni? "╯" : "+";
  const std::string H  = uni? "─" : "-";
  const std::string V  = uni? "│" : "|";
  const std::string border = sgr_fg(kTrackColor);
  auto top = [&]{
    std::string t = trunc_pad(" " + title + " ", std::min(iw, display_cols(title) + 2));
    int fill = std::max(0, iw - display_cols(t));
    int left = 1 < fill ? 1 : 0; int right = fill - left;
    return border + TL + repeat_str(H, left) + sgr_reset() + sgr_bold() + t + sgr_reset() +
           border + repeat_str(H, right) + TR + sgr_reset();
  }();
  out.push_back(top);
  int content_lines = std::max(static_cast<int>(lines.size()), min_height);
  for (int i = 0; i < content_lines; ++i) {
    std::string ln = (i < static_cast<int>(lines.size())) ? lines[static_cast<size_t>(i)] : std::string();
    out.push_back(border + V + sgr_reset() + trunc_pad(ln, iw) + border + V + sgr_reset());
  }
  out.push_back(border + BL + repeat_str(H, iw) + BR + sgr_reset());
  return out;
}

std::vector<std::string> help_lines() {
  return {
    "q quit   v style   l layout   t theme",
    "1-8 select tile   m tile style   r reset tile",
    "[ ] move tile   a autostart   h help",
  };
}

// Tile grid rows. `compact` renders graphic tiles as Minimal and drops the
// blank line between rows.
static std::vector<std::string> tile_grid(const WidgetFrame& f, const sonitor::model::TileReadings& r,
                                          int tile_w, int per_row, bool compact) {
  const int gap = 1;
  std::vector<std::string> body;
  for (size_t start = 0; start < f.tiles.size(); start += static_cast<size_t>(per_row)) {
    size_t end = std::min(f.tiles.size(), start + static_cast<size_t>(per_row));
    std::vector<std::vector<std::string>> blocks;
    int row_h = 0;
    for (size_t i = start; i < end; ++i) {
      TileView tv = f.tiles[i];
      if (compact) tv.mode = sonitor::model::VisMode::Minimal;
      blocks.push_back(render_tile(tv, r[sonitor::model::tile_index(tv.id)], f.theme, tile_w));
      row_h = std::max(row_h, static_cast<int>(blocks.back().size()));
    }
    if (start > 0 && !compact) body.emplace_back();
    for (int line = 0; line < row_h; ++line) {
      std::string ln;
      for (size_t b = 0; b < blocks.size(); ++b) {
        if (b > 0) ln += std::string(static_cast<size_t>(gap), ' ');
        const auto& blk = blocks[b];
        ln += (line < static_cast<int>(blk.size())) ? trunc_pad(blk[static_cast<size_t>(line)], tile_w)
                                                    : std::string(static_cast<size_t>(tile_w), ' ');
      }
      body.push_back(std::move(ln));
    }
  }
  return body;
}

std::vector<std::string> render_widget(const WidgetFrame& f, const sonitor::model::TileReadings& r,
                                       int max_cols, int max_rows) {
  const int width = widget_cols(f.layout, max_cols);
  const int inner = std::max(1, width - 2);
  const int per_row = std::max(1, sonitor::model::tiles_per_row(f.layout));
  const int tile_w = std::max(4, (inner - (per_row - 1)) / per_row);

  const bool uni = use_unicode();
  const std::string sep = uni ? " · " : " / ";
  std::string info = std::string(sonitor::model::to_string(f.layout)) + sep +
                     sonitor::model::to_string(f.global_mode) + sep + f.theme.name;
  if (f.autostart) info += sep + "autostart";
  const std::string title = uni ? "⚡ Sonitor" : "Sonitor";

  auto boxed = [&](bool compact) {
    std::vector<std::string> body;
    body.push_back(sgr_fg(kLabelColor) + trunc_pad(info, inner) + sgr_reset());
    for (auto& ln : tile_grid(f, r, tile_w, per_row, compact)) body.push_back(std::move(ln));
    if (!f.status.empty()) body.push_back(sgr_fg(kLabelColor) + f.status + sgr_reset());
    int min_h = 0;
    if (!compact) min_h = std::max(0, sonitor::model::reference_size(f.layout, f.global_mode).height / 16 - 2);
    return make_box(title, body, width, min_h);
  };

  std::vector<std::string> footer;
  if (f.show_help) {
    for (const auto& h : help_lines()) footer.push_back(trunc_pad(h, width));
  } else {
    footer.push_back(sgr_fg(kLabelColor) + trunc_pad("h help  q quit", width) + sgr_reset());
  }

  auto out = boxed(false);
  if (max_rows <= 0 || static_cast<int>(out.size() + footer.size()) <= max_rows) {
    out.insert(out.end(), footer.begin(), footer.end());
    return out;
  }
  // Too tall for the terminal: drop the footer, then shrink the tiles, then
  // cut body lines while keeping the bottom border.
  if (static_cast<int>(out.size()) > max_rows) out = boxed(true);
  if (static_cast<int>(out.size()) > max_rows) {
    std::string bottom = out.back();
    if (max_rows >= 2) {
      out.resize(static_cast<size_t>(max_rows - 1));
      out.push_back(std::move(bottom));
    } else {
      out.resize(static_cast<size_t>(max_rows));
    }
  }
  return out;
}

void present(const std::vector<std::string>& lines) {
  std::string frame = "\x1B[H";
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) frame += "\r\n";
    frame += lines[i];
    frame += "\x1B[K";
  }
  frame += "\x1B[J";
  best_effort_write(STDOUT_FILENO, frame.data(), frame.size());
}

} // namespace sonitor::ui
