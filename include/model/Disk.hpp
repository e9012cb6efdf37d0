#pragma once
#include <cstdint>

namespace sonitor::model {

// Aggregate over whole block devices.
struct DiskSnapshot {
  double total_read_bps{};
  double total_write_bps{};
};

} // namespace sonitor::model
