#include "minitest.hpp"
#include "fixture.hpp"
#include "collectors/DiskCollector.hpp"

TEST(disk_collector_parses_and_deltas) {
  FakeRoot root("disk");
  root.write("proc/diskstats",
    "   8       0 sda 100 0 1000 0  200 0 2000 0  0  100 0\n"
    "   8       1 sda1 90 0 900 0  180 0 1800 0  0  90 0\n"
    "   7       0 loop0 5 0 50 0  0 0 0 0  0  0 0\n");
  sonitor::collectors::DiskCollector c; sonitor::model::DiskSnapshot s{};
  ASSERT_TRUE(c.sample_at(s, 10.0));
  ASSERT_NEAR(s.total_read_bps, 0.0, 1e-9);
  root.write("proc/diskstats",
    "   8       0 sda 150 0 2000 0  260 0 2600 0  0  160 0\n"
    "   8       1 sda1 140 0 1900 0  240 0 2400 0  0  150 0\n"
    "   7       0 loop0 9 0 90 0  0 0 0 0  0  0 0\n");
  ASSERT_TRUE(c.sample_at(s, 12.0));
  // 1000 sectors read and 600 written over 2 s
  ASSERT_NEAR(s.total_read_bps, 1000.0 * 512.0 / 2.0, 1e-6);
  ASSERT_NEAR(s.total_write_bps, 600.0 * 512.0 / 2.0, 1e-6);
}

TEST(disk_collector_counter_reset_clamps) {
  FakeRoot root("disk_reset");
  root.write("proc/diskstats", "   8       0 sda 100 0 5000 0  200 0 5000 0  0  100 0\n");
  sonitor::collectors::DiskCollector c; sonitor::model::DiskSnapshot s{};
  ASSERT_TRUE(c.sample_at(s, 1.0));
  root.write("proc/diskstats", "   8       0 sda 1 0 10 0  2 0 20 0  0  1 0\n");
  ASSERT_TRUE(c.sample_at(s, 2.0));
  ASSERT_NEAR(s.total_read_bps, 0.0, 1e-9);
  ASSERT_NEAR(s.total_write_bps, 0.0, 1e-9);
}

TEST(disk_partition_detection) {
  std::vector<std::string> names{"sda", "sda1", "nvme0n1", "nvme0n1p2", "mmcblk0"};
  ASSERT_TRUE(sonitor::collectors::is_partition_of_listed("sda1", names));
  ASSERT_TRUE(sonitor::collectors::is_partition_of_listed("nvme0n1p2", names));
  ASSERT_TRUE(!sonitor::collectors::is_partition_of_listed("sda", names));
  ASSERT_TRUE(!sonitor::collectors::is_partition_of_listed("nvme0n1", names));
  ASSERT_TRUE(!sonitor::collectors::is_partition_of_listed("sdb1", names));
}
