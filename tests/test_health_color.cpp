#include "minitest.hpp"
#include "ui/HealthColor.hpp"
#include <cmath>
#include <limits>

using sonitor::ui::Rgb;
using sonitor::ui::Theme;
using sonitor::ui::map_percent_to_color;

static Theme test_theme() {
  return Theme{"test", Rgb{0.0, 0.5, 0.2}, Rgb{1.0, 0.6, 0.0}, Rgb{1.0, 0.2, 0.2}};
}

TEST(health_good_up_to_fifty) {
  auto th = test_theme();
  for (double p : {-50.0, 0.0, 12.5, 49.999, 50.0})
    ASSERT_TRUE(map_percent_to_color(p, th) == th.good);
}

TEST(health_danger_at_and_above_hundred) {
  auto th = test_theme();
  for (double p : {100.0, 100.5, 250.0, std::numeric_limits<double>::infinity()})
    ASSERT_TRUE(map_percent_to_color(p, th) == th.danger);
}

TEST(health_exact_at_seventy_five) {
  auto th = test_theme();
  ASSERT_TRUE(map_percent_to_color(75.0, th) == th.warn);
  auto below = map_percent_to_color(74.9999999, th);
  auto above = map_percent_to_color(75.0000001, th);
  ASSERT_NEAR(below.r, th.warn.r, 1e-6);
  ASSERT_NEAR(below.g, th.warn.g, 1e-6);
  ASSERT_NEAR(above.r, th.warn.r, 1e-6);
  ASSERT_NEAR(above.g, th.warn.g, 1e-6);
}

TEST(health_continuous_above_fifty) {
  auto th = test_theme();
  auto c = map_percent_to_color(50.0000001, th);
  ASSERT_NEAR(c.r, th.good.r, 1e-6);
  ASSERT_NEAR(c.g, th.good.g, 1e-6);
  ASSERT_NEAR(c.b, th.good.b, 1e-6);
}

TEST(health_midpoint_interpolation) {
  Theme th{"bw", Rgb{0, 0, 0}, Rgb{1, 1, 1}, Rgb{1, 0, 0}};
  ASSERT_TRUE(map_percent_to_color(62.5, th) == (Rgb{0.5, 0.5, 0.5}));
  auto c = map_percent_to_color(87.5, th);
  ASSERT_NEAR(c.r, 1.0, 1e-12);
  ASSERT_NEAR(c.g, 0.5, 1e-12);
  ASSERT_NEAR(c.b, 0.5, 1e-12);
}

TEST(health_channels_move_monotonically) {
  Theme th{"ramp", Rgb{0, 0, 0}, Rgb{0.5, 0.5, 0.5}, Rgb{1, 1, 1}};
  double prev = -1.0;
  for (int i = 0; i <= 1000; ++i) {
    double p = i * 0.1;
    auto c = map_percent_to_color(p, th);
    ASSERT_TRUE(c.r >= prev);
    ASSERT_TRUE(c.r >= 0.0 && c.r <= 1.0);
    prev = c.r;
  }
}

TEST(health_nan_reads_as_zero) {
  auto th = test_theme();
  ASSERT_TRUE(map_percent_to_color(std::nan(""), th) == th.good);
}

TEST(health_pure_and_repeatable) {
  auto th = test_theme();
  auto a = map_percent_to_color(81.3, th);
  auto b = map_percent_to_color(sonitor::ui::HealthSample{81.3}, th);
  ASSERT_TRUE(a == b);
}

TEST(theme_lookup_and_cycle) {
  auto names = sonitor::ui::theme_names();
  ASSERT_EQ(names.size(), 4u);
  ASSERT_EQ(sonitor::ui::default_theme().name, std::string("classic"));
  ASSERT_TRUE(sonitor::ui::find_theme("OCEAN").has_value());
  ASSERT_TRUE(!sonitor::ui::find_theme("plaid").has_value());
  ASSERT_EQ(sonitor::ui::next_theme_name("classic"), std::string("ocean"));
  ASSERT_EQ(sonitor::ui::next_theme_name(names.back()), names.front());
  ASSERT_EQ(sonitor::ui::next_theme_name("unknown"), names.front());
}

TEST(hex_colors) {
  auto c = sonitor::ui::parse_hex_rgb("#00CC66");
  ASSERT_TRUE(c.has_value());
  ASSERT_EQ(sonitor::ui::rgb_to_hex(*c), std::string("#00CC66"));
  ASSERT_EQ(sonitor::ui::rgb_to_hex(sonitor::ui::default_theme().danger), std::string("#FF3333"));
  ASSERT_EQ(sonitor::ui::rgb_to_hex(Rgb{2.0, -1.0, 0.5}), std::string("#FF007F"));
  ASSERT_TRUE(!sonitor::ui::parse_hex_rgb("00CC66").has_value());
  ASSERT_TRUE(!sonitor::ui::parse_hex_rgb("#00CC6G").has_value());
  ASSERT_TRUE(!sonitor::ui::parse_hex_rgb("#0C6").has_value());
}
