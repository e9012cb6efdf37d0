#pragma once
#include "model/Snapshot.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace sonitor::collectors {

// Aggregate block device throughput from /proc/diskstats sector counters.
class DiskCollector {
public:
  bool sample(sonitor::model::DiskSnapshot& out);
  // Same as sample() with an explicit monotonic timestamp in seconds.
  bool sample_at(sonitor::model::DiskSnapshot& out, double ts);
private:
  struct Prev { uint64_t rdsec{}, wrsec{}; double ts{}; };
  std::unordered_map<std::string, Prev> last_;
  static constexpr uint64_t kSectorSize = 512; // diskstats always counts 512-byte units
};

// True when `name` is a partition of another device in `names`
// ("sda1" of "sda", "nvme0n1p2" of "nvme0n1").
[[nodiscard]] bool is_partition_of_listed(const std::string& name, const std::vector<std::string>& names);

} // namespace sonitor::collectors
