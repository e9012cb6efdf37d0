#include "minitest.hpp"
#include "fixture.hpp"
#include "collectors/NetCollector.hpp"

static std::string net_dev(const std::string& rows) {
  return "Inter-|   Receive                                                |  Transmit\n"
         " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n" +
         rows;
}

TEST(net_collector_parses_and_deltas) {
  FakeRoot root("net");
  root.write("proc/net/dev", net_dev("  eth0: 1000 0 0 0 0 0 0 0  2000 0 0 0 0 0 0 0\n"
                                     "    lo: 500 0 0 0 0 0 0 0  500 0 0 0 0 0 0 0\n"));
  sonitor::collectors::NetCollector c; sonitor::model::NetSnapshot s{};
  ASSERT_TRUE(c.sample_at(s, 5.0));
  ASSERT_NEAR(s.agg_rx_bps, 0.0, 1e-9);
  root.write("proc/net/dev", net_dev("  eth0: 11000 0 0 0 0 0 0 0  32000 0 0 0 0 0 0 0\n"
                                     "    lo: 90500 0 0 0 0 0 0 0  90500 0 0 0 0 0 0 0\n"));
  ASSERT_TRUE(c.sample_at(s, 6.0));
  ASSERT_NEAR(s.agg_rx_bps, 10000.0, 1e-6);
  ASSERT_NEAR(s.agg_tx_bps, 30000.0, 1e-6);
}

TEST(net_collector_counter_reset_reads_zero) {
  FakeRoot root("net_reset");
  root.write("proc/net/dev", net_dev("  eth0: 9000 0 0 0 0 0 0 0  9000 0 0 0 0 0 0 0\n"));
  sonitor::collectors::NetCollector c; sonitor::model::NetSnapshot s{};
  ASSERT_TRUE(c.sample_at(s, 1.0));
  root.write("proc/net/dev", net_dev("  eth0: 10 0 0 0 0 0 0 0  10 0 0 0 0 0 0 0\n"));
  ASSERT_TRUE(c.sample_at(s, 2.0));
  ASSERT_NEAR(s.agg_rx_bps, 0.0, 1e-9);
  ASSERT_NEAR(s.agg_tx_bps, 0.0, 1e-9);
}

TEST(net_virtual_interfaces) {
  ASSERT_TRUE(sonitor::collectors::is_virtual_iface("lo"));
  ASSERT_TRUE(sonitor::collectors::is_virtual_iface("veth12ab"));
  ASSERT_TRUE(sonitor::collectors::is_virtual_iface("docker0"));
  ASSERT_TRUE(sonitor::collectors::is_virtual_iface("br-5f3a"));
  ASSERT_TRUE(sonitor::collectors::is_virtual_iface("virbr0"));
  ASSERT_TRUE(!sonitor::collectors::is_virtual_iface("wlp3s0"));
  ASSERT_TRUE(!sonitor::collectors::is_virtual_iface("enp0s31f6"));
}
