#pragma once
#include <cstdint>
#include <string>
#include "model/Cpu.hpp"
#include "model/Net.hpp"
#include "model/Disk.hpp"
#include "model/Thermal.hpp"

namespace sonitor::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t used_kb{};
  double   used_pct{}; // 0..100
  uint64_t swap_total_kb{};
  uint64_t swap_used_kb{};
  double   swap_used_pct{}; // 0..100, 0 when no swap
};

struct Gpu {
  bool available{false};
  std::string name;        // e.g. "NVIDIA GeForce RTX 2060"
  uint64_t total_mb{};
  uint64_t used_mb{};
  double   used_pct{};     // VRAM 0..100
  bool     has_util{false};
  double   util_pct{0.0};  // core utilization 0..100
  bool     has_temp{false};
  double   temp_c{0.0};
};

struct Snapshot {
  uint64_t seq{};
  CpuSnapshot cpu;
  Memory   mem;
  Gpu      gpu;
  NetSnapshot net;
  DiskSnapshot disk;
  Thermal thermal;
};

} // namespace sonitor::model
