#pragma once
#include <string>
#include <utility>
#include "model/Snapshot.hpp"

namespace sonitor::collectors {

struct GpuOptions {
  bool use_nvml{true};
  std::string nvml_path; // optional libnvidia-ml override
};

class GpuCollector {
public:
  GpuCollector() = default;
  explicit GpuCollector(GpuOptions opts) : opts_(std::move(opts)) {}
  // Tries NVML, then /proc/driver/nvidia, then amdgpu sysfs. Returns false
  // (and leaves `out.available` false) when no GPU is found.
  bool sample(sonitor::model::Gpu& out) const;
private:
  GpuOptions opts_{};
};

// "NVIDIA GeForce RTX 3080" -> "RTX 3080"
[[nodiscard]] std::string short_gpu_name(std::string name);

} // namespace sonitor::collectors
