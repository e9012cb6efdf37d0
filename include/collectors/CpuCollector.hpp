#pragma once
#include "model/Snapshot.hpp"
#include <optional>

namespace sonitor::collectors {

class CpuCollector {
public:
  CpuCollector() = default;
  // First call only seeds the counters; usage is 0 until the second call.
  bool sample(sonitor::model::CpuSnapshot& out);
private:
  sonitor::model::CpuTimes last_total_{};
  bool has_last_{false};
};

// Current clock of cpu0 in MHz: cpufreq scaling_cur_freq (kHz), then the
// first "cpu MHz" line of /proc/cpuinfo.
[[nodiscard]] std::optional<double> read_cpu_freq_mhz();

} // namespace sonitor::collectors
