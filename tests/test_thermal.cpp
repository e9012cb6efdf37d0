#include "minitest.hpp"
#include "fixture.hpp"
#include "collectors/ThermalCollector.hpp"
#include "util/Procfs.hpp"

TEST(thermal_collector_reads_hwmon_with_sys_root) {
  FakeRoot root("thermal");
  root.write("sys/class/hwmon/hwmon0/temp1_input", "56000\n");
  root.write("sys/class/hwmon/hwmon0/temp2_input", "61500\n");
  root.write("sys/class/hwmon/hwmon0/temp1_label", "Package id 0\n");
  root.write("sys/class/thermal/thermal_zone0/temp", "90000\n");
  ASSERT_TRUE(std::filesystem::exists(sonitor::util::map_sys_path("/sys/class/hwmon")));
  sonitor::collectors::ThermalCollector t;
  sonitor::model::Thermal th{};
  ASSERT_TRUE(t.sample(th));
  ASSERT_TRUE(th.has_temp);
  // hwmon wins over thermal zones
  ASSERT_NEAR(th.cpu_max_c, 61.5, 1e-9);
}

TEST(thermal_collector_falls_back_to_thermal_zone) {
  FakeRoot root("thermal_zone");
  root.write("sys/class/thermal/thermal_zone0/temp", "42000\n");
  root.write("sys/class/thermal/thermal_zone1/temp", "47000\n");
  root.write("sys/class/thermal/cooling_device0/cur_state", "99000\n");
  sonitor::collectors::ThermalCollector t;
  sonitor::model::Thermal th{};
  ASSERT_TRUE(t.sample(th));
  ASSERT_NEAR(th.cpu_max_c, 47.0, 1e-9);
}

TEST(thermal_collector_without_sensors) {
  FakeRoot root("thermal_none");
  sonitor::collectors::ThermalCollector t;
  sonitor::model::Thermal th{};
  ASSERT_TRUE(!t.sample(th));
  ASSERT_TRUE(!th.has_temp);
}
