#include "minitest.hpp"
#include "ui/Canvas.hpp"
#include "ui/Formatting.hpp"
#include <numbers>

using sonitor::ui::Canvas;
using sonitor::ui::Rgb;

static const Rgb kWhite{1.0, 1.0, 1.0};

TEST(braille_glyph_code_points) {
  ASSERT_EQ(sonitor::ui::braille_glyph(0x00), std::string("\xE2\xA0\x80"));
  ASSERT_EQ(sonitor::ui::braille_glyph(0x01), std::string("\xE2\xA0\x81"));
  ASSERT_EQ(sonitor::ui::braille_glyph(0xFF), std::string("\xE2\xA3\xBF"));
}

TEST(canvas_dot_layout) {
  Canvas cv(2, 1);
  ASSERT_EQ(cv.width(), 4);
  ASSERT_EQ(cv.height(), 4);
  cv.set(0, 0, kWhite);
  cv.set(1, 3, kWhite);
  ASSERT_TRUE(cv.is_set(0, 0));
  ASSERT_TRUE(cv.is_set(1, 3));
  ASSERT_TRUE(!cv.is_set(1, 0));
  // 0x01 | 0x80
  auto ln = cv.lines().at(0);
  ASSERT_TRUE(ln.find("\xE2\xA2\x81") != std::string::npos);
  ASSERT_EQ(sonitor::ui::display_cols(ln), 2);
}

TEST(canvas_ignores_out_of_range) {
  Canvas cv(1, 1);
  cv.set(-1, 0, kWhite);
  cv.set(2, 0, kWhite);
  cv.set(0, 4, kWhite);
  ASSERT_TRUE(!cv.is_set(-1, 0));
  ASSERT_EQ(cv.lines().at(0), std::string(" "));
}

TEST(canvas_line_endpoints) {
  Canvas cv(4, 2);
  cv.line(0, 0, 7, 7, kWhite);
  for (int i = 0; i < 8; ++i) ASSERT_TRUE(cv.is_set(i, i));
  ASSERT_TRUE(!cv.is_set(7, 0));
  Canvas flat(4, 1);
  flat.line(6, 2, 1, 2, kWhite);
  for (int x = 1; x <= 6; ++x) ASSERT_TRUE(flat.is_set(x, 2));
  ASSERT_TRUE(!flat.is_set(0, 2));
}

TEST(canvas_arc_stays_on_radius) {
  Canvas cv(10, 5);
  const double cx = 10.0, cy = 10.0, r = 8.0;
  cv.arc(cx, cy, r, 0.0, 2.0 * std::numbers::pi, kWhite);
  ASSERT_TRUE(cv.is_set(18, 10));
  ASSERT_TRUE(cv.is_set(2, 10));
  ASSERT_TRUE(cv.is_set(10, 2));
  ASSERT_TRUE(cv.is_set(10, 18));
  ASSERT_TRUE(!cv.is_set(10, 10));
}

TEST(canvas_text_overlays_cells) {
  Canvas cv(6, 1);
  cv.set(0, 0, kWhite);
  cv.text_centered(0, "42%", kWhite);
  auto ln = cv.lines().at(0);
  ASSERT_TRUE(ln.find("42%") != std::string::npos);
  ASSERT_EQ(sonitor::ui::display_cols(ln), 6);
}
