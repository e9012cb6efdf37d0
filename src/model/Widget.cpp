#include "model/Widget.hpp"

#include <algorithm>
#include <cctype>

namespace sonitor::model {

static std::string lower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == ' ' || c == '\t') continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

const char* to_string(VisMode m) {
  switch (m) {
    case VisMode::Bar:     return "bar";
    case VisMode::Gauge:   return "gauge";
    case VisMode::Arc:     return "arc";
    case VisMode::Ring:    return "ring";
    case VisMode::Minimal: return "minimal";
  }
  return "bar";
}

const char* to_string(Layout l) {
  switch (l) {
    case Layout::Compact:  return "compact";
    case Layout::Wide:     return "wide";
    case Layout::Vertical: return "vertical";
    case Layout::Mini:     return "mini";
  }
  return "compact";
}

const char* to_string(TileId t) {
  switch (t) {
    case TileId::Cpu:  return "cpu";
    case TileId::Ram:  return "ram";
    case TileId::Swap: return "swap";
    case TileId::Gpu:  return "gpu";
    case TileId::Vram: return "vram";
    case TileId::Disk: return "disk";
    case TileId::Net:  return "net";
    case TileId::Temp: return "temp";
  }
  return "cpu";
}

std::optional<VisMode> parse_vis_mode(std::string_view s) {
  auto k = lower(s);
  for (auto m : kAllModes) if (k == to_string(m)) return m;
  return std::nullopt;
}

std::optional<Layout> parse_layout(std::string_view s) {
  auto k = lower(s);
  for (auto l : kAllLayouts) if (k == to_string(l)) return l;
  return std::nullopt;
}

std::optional<TileId> parse_tile(std::string_view s) {
  auto k = lower(s);
  for (auto t : kAllTiles) if (k == to_string(t)) return t;
  return std::nullopt;
}

VisMode next_mode(VisMode m) {
  switch (m) {
    case VisMode::Bar:     return VisMode::Gauge;
    case VisMode::Gauge:   return VisMode::Arc;
    case VisMode::Arc:     return VisMode::Ring;
    case VisMode::Ring:    return VisMode::Minimal;
    case VisMode::Minimal: return VisMode::Bar;
  }
  return VisMode::Bar;
}

Layout next_layout(Layout l) {
  switch (l) {
    case Layout::Compact:  return Layout::Wide;
    case Layout::Wide:     return Layout::Vertical;
    case Layout::Vertical: return Layout::Mini;
    case Layout::Mini:     return Layout::Compact;
  }
  return Layout::Compact;
}

bool is_graphic(VisMode m) {
  switch (m) {
    case VisMode::Gauge:
    case VisMode::Arc:
    case VisMode::Ring:
      return true;
    case VisMode::Bar:
    case VisMode::Minimal:
      return false;
  }
  return false;
}

bool is_io_tile(TileId t) { return t == TileId::Disk || t == TileId::Net; }

const char* tile_label(TileId t) {
  switch (t) {
    case TileId::Cpu:  return "CPU";
    case TileId::Ram:  return "RAM";
    case TileId::Swap: return "Swap";
    case TileId::Gpu:  return "GPU";
    case TileId::Vram: return "VRAM";
    case TileId::Disk: return "Disk";
    case TileId::Net:  return "Network";
    case TileId::Temp: return "Temp";
  }
  return "";
}

const char* tile_unit(TileId t) { return t == TileId::Temp ? "°C" : "%"; }

const std::vector<TileId>& default_order(Layout l) {
  using T = TileId;
  static const std::vector<TileId> compact{T::Cpu, T::Ram, T::Swap, T::Gpu, T::Vram, T::Disk, T::Net, T::Temp};
  static const std::vector<TileId> wide{T::Cpu, T::Ram, T::Gpu, T::Temp};
  static const std::vector<TileId> vertical{T::Cpu, T::Ram, T::Swap, T::Gpu, T::Vram, T::Temp, T::Disk, T::Net};
  static const std::vector<TileId> mini{T::Cpu, T::Ram, T::Gpu};
  switch (l) {
    case Layout::Compact:  return compact;
    case Layout::Wide:     return wide;
    case Layout::Vertical: return vertical;
    case Layout::Mini:     return mini;
  }
  return compact;
}

int tiles_per_row(Layout l) {
  switch (l) {
    case Layout::Compact:  return 4;
    case Layout::Wide:     return 4;
    case Layout::Vertical: return 1;
    case Layout::Mini:     return 3;
  }
  return 4;
}

WindowSize reference_size(Layout l, VisMode global_mode) {
  bool tall = is_graphic(global_mode);
  switch (l) {
    case Layout::Compact:  return {480, tall ? 220 : 180};
    case Layout::Wide:     return {400, tall ? 120 : 100};
    case Layout::Vertical: return {130, tall ? 550 : 450};
    case Layout::Mini:     return {300, tall ? 100 : 80};
  }
  return {480, 180};
}

std::vector<TileId> parse_order(std::string_view csv) {
  std::vector<TileId> out;
  size_t start = 0;
  while (start <= csv.size()) {
    size_t end = csv.find(',', start);
    if (end == std::string_view::npos) end = csv.size();
    if (auto t = parse_tile(csv.substr(start, end - start))) {
      if (std::find(out.begin(), out.end(), *t) == out.end()) out.push_back(*t);
    }
    start = end + 1;
  }
  return out;
}

std::string join_order(const std::vector<TileId>& order) {
  std::string out;
  for (auto t : order) {
    if (!out.empty()) out += ',';
    out += to_string(t);
  }
  return out;
}

} // namespace sonitor::model
