#pragma once
#include <cstdint>

namespace sonitor::model {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct CpuSnapshot {
  CpuTimes total_times{};
  double usage_pct{};               // aggregate percent 0..100
  bool has_freq{false};
  double freq_mhz{0.0};             // current clock of cpu0
};

} // namespace sonitor::model
