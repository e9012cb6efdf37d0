#pragma once
#include <utility>
#include "collectors/CpuCollector.hpp"
#include "collectors/DiskCollector.hpp"
#include "collectors/GpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/NetCollector.hpp"
#include "collectors/ThermalCollector.hpp"
#include "model/Snapshot.hpp"
#include "model/Widget.hpp"

namespace sonitor::app {

// Owns the collectors and refreshes a Snapshot on the caller's thread,
// once per widget tick.
class Sampler {
public:
  Sampler() = default;
  explicit Sampler(sonitor::collectors::GpuOptions gpu_opts) : gpu_(std::move(gpu_opts)) {}

  // Seed the delta-based collectors (CPU, disk, net) so the first real
  // sample() reports rates instead of zeros.
  void prime();

  // Refresh every collector once. A collector whose source is unavailable
  // leaves its part at defaults. Returns false only if nothing was read.
  bool sample(sonitor::model::Snapshot& out);

private:
  sonitor::collectors::CpuCollector cpu_{};
  sonitor::collectors::MemoryCollector mem_{};
  sonitor::collectors::GpuCollector gpu_{};
  sonitor::collectors::NetCollector net_{};
  sonitor::collectors::DiskCollector disk_{};
  sonitor::collectors::ThermalCollector thermal_{};
  uint64_t seq_{0};
};

// Per-tile values and detail strings for one snapshot.
[[nodiscard]] sonitor::model::TileReadings tile_readings(const sonitor::model::Snapshot& s);

} // namespace sonitor::app
