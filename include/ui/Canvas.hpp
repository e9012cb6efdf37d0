#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ui/HealthColor.hpp"

namespace sonitor::ui {

// Braille dot canvas: each terminal cell holds 2x4 dots and one color.
// Dot coordinates grow right (x) and down (y); angles follow the same
// orientation, so 0 points right and pi/2 points down.
class Canvas {
public:
  Canvas(int cols, int rows);

  [[nodiscard]] int cols() const { return cols_; }
  [[nodiscard]] int rows() const { return rows_; }
  [[nodiscard]] int width() const { return cols_ * 2; }   // dots
  [[nodiscard]] int height() const { return rows_ * 4; }  // dots

  // Out-of-range dots are ignored. The last color set in a cell wins.
  void set(int x, int y, const Rgb& color);
  [[nodiscard]] bool is_set(int x, int y) const;

  void line(int x0, int y0, int x1, int y1, const Rgb& color);
  // Arc from a0 to a1 (radians, a1 >= a0), `thickness` dots inward.
  void arc(double cx, double cy, double r, double a0, double a1, const Rgb& color, int thickness = 1);
  void disc(double cx, double cy, double r, const Rgb& color);

  // Text replaces whole cells. One display column per code point.
  void text(int row, int col, const std::string& s, const Rgb& color);
  void text_centered(int row, const std::string& s, const Rgb& color);

  // One UTF-8 string per cell row, colored with SGR runs when on a tty.
  [[nodiscard]] std::vector<std::string> lines() const;

private:
  struct Cell {
    uint8_t dots{0};
    Rgb color{};
    std::optional<std::string> glyph;
    std::optional<Rgb> glyph_color;
  };
  int cols_;
  int rows_;
  std::vector<Cell> cells_;

  Cell* cell_at(int col, int row);
};

// U+2800 + mask, for one cell's dot mask
[[nodiscard]] std::string braille_glyph(uint8_t mask);

} // namespace sonitor::ui
