#include "ui/Canvas.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace sonitor::ui {

// Bit for dot (dx, dy) inside a cell, dx in 0..1, dy in 0..3.
static constexpr uint8_t kDotBits[4][2] = {
  {0x01, 0x08},
  {0x02, 0x10},
  {0x04, 0x20},
  {0x40, 0x80},
};

std::string braille_glyph(uint8_t mask) {
  uint32_t cp = 0x2800u + mask;
  std::string s;
  s.push_back(static_cast<char>(0xE0 | (cp >> 12)));
  s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  return s;
}

Canvas::Canvas(int cols, int rows)
    : cols_(std::max(0, cols)), rows_(std::max(0, rows)),
      cells_(static_cast<size_t>(cols_) * static_cast<size_t>(rows_)) {}

Canvas::Cell* Canvas::cell_at(int col, int row) {
  if (col < 0 || row < 0 || col >= cols_ || row >= rows_) return nullptr;
  return &cells_[static_cast<size_t>(row) * static_cast<size_t>(cols_) + static_cast<size_t>(col)];
}

void Canvas::set(int x, int y, const Rgb& color) {
  if (x < 0 || y < 0) return;
  Cell* c = cell_at(x / 2, y / 4);
  if (!c) return;
  c->dots |= kDotBits[y % 4][x % 2];
  c->color = color;
}

bool Canvas::is_set(int x, int y) const {
  if (x < 0 || y < 0 || x >= width() || y >= height()) return false;
  const auto& c = cells_[static_cast<size_t>(y / 4) * static_cast<size_t>(cols_) + static_cast<size_t>(x / 2)];
  return (c.dots & kDotBits[y % 4][x % 2]) != 0;
}

void Canvas::line(int x0, int y0, int x1, int y1, const Rgb& color) {
  // Bresenham; clipping happens per dot in set()
  const int dx = std::abs(x1 - x0);
  const int dy = std::abs(y1 - y0);
  const int sx = x0 < x1 ? 1 : -1;
  const int sy = y0 < y1 ? 1 : -1;
  int error = dx - dy;
  int x = x0, y = y0;
  while (true) {
    set(x, y, color);
    if (x == x1 && y == y1) break;
    const int twice_error = error * 2;
    if (twice_error > -dy) { error -= dy; x += sx; }
    if (twice_error < dx) { error += dx; y += sy; }
  }
}

void Canvas::arc(double cx, double cy, double r, double a0, double a1, const Rgb& color, int thickness) {
  if (!(a1 > a0) || r <= 0.0) return;
  for (int k = 0; k < std::max(1, thickness); ++k) {
    double rr = r - 0.8 * k;
    if (rr <= 0.0) break;
    int steps = std::max(8, static_cast<int>(std::ceil((a1 - a0) * rr * 2.0)));
    for (int i = 0; i <= steps; ++i) {
      double a = a0 + (a1 - a0) * static_cast<double>(i) / steps;
      set(static_cast<int>(std::lround(cx + rr * std::cos(a))),
          static_cast<int>(std::lround(cy + rr * std::sin(a))), color);
    }
  }
}

void Canvas::disc(double cx, double cy, double r, const Rgb& color) {
  int x0 = static_cast<int>(std::floor(cx - r)), x1 = static_cast<int>(std::ceil(cx + r));
  int y0 = static_cast<int>(std::floor(cy - r)), y1 = static_cast<int>(std::ceil(cy + r));
  for (int y = y0; y <= y1; ++y)
    for (int x = x0; x <= x1; ++x) {
      double ddx = x - cx, ddy = y - cy;
      if (ddx * ddx + ddy * ddy <= r * r) set(x, y, color);
    }
}

void Canvas::text(int row, int col, const std::string& s, const Rgb& color) {
  size_t i = 0;
  while (i < s.size()) {
    int len = u8_len(static_cast<unsigned char>(s[i]));
    if (i + static_cast<size_t>(len) > s.size()) len = 1;
    if (Cell* c = cell_at(col, row)) {
      c->glyph = s.substr(i, static_cast<size_t>(len));
      c->glyph_color = color;
    }
    i += static_cast<size_t>(len);
    ++col;
  }
}

void Canvas::text_centered(int row, const std::string& s, const Rgb& color) {
  int w = display_cols(s);
  text(row, std::max(0, (cols_ - w) / 2), s, color);
}

std::vector<std::string> Canvas::lines() const {
  std::vector<std::string> out;
  out.reserve(static_cast<size_t>(rows_));
  for (int row = 0; row < rows_; ++row) {
    std::string ln;
    std::optional<Rgb> current;
    for (int col = 0; col < cols_; ++col) {
      const auto& c = cells_[static_cast<size_t>(row) * static_cast<size_t>(cols_) + static_cast<size_t>(col)];
      if (c.glyph) {
        if (!current || !(*current == *c.glyph_color)) { ln += sgr_fg(*c.glyph_color); current = c.glyph_color; }
        ln += *c.glyph;
      } else if (c.dots) {
        if (!current || !(*current == c.color)) { ln += sgr_fg(c.color); current = c.color; }
        ln += braille_glyph(c.dots);
      } else {
        ln += ' ';
      }
    }
    if (current) ln += sgr_reset();
    out.push_back(std::move(ln));
  }
  return out;
}

} // namespace sonitor::ui
