#pragma once
#include <string>
#include "model/Snapshot.hpp"

namespace sonitor::util {

// Runtime NVML loader (dlopen/dlsym); no build-time dependency on nvml.h.
class NvmlDyn {
public:
  static NvmlDyn& instance();

  // Attempt to load libnvidia-ml once (idempotent). A non-empty
  // `override_path` is tried first if it lives under a system library prefix.
  bool load_once(const std::string& override_path = {});

  // True if library is loaded and core symbols are present.
  [[nodiscard]] bool available() const;

  // Fill device-level GPU metrics (first device). Returns true if any data found.
  bool read_device(sonitor::model::Gpu& out);

  ~NvmlDyn();

private:
  NvmlDyn() = default;
  NvmlDyn(const NvmlDyn&) = delete;
  NvmlDyn& operator=(const NvmlDyn&) = delete;

  void* handle_{};
  bool loaded_{false};
  bool initialized_{false};

  using nvmlReturn_t = int; // NVML_SUCCESS == 0
  using nvmlDevice_t = void*;
  struct nvmlMemory_t { unsigned long long total, free, used; };
  struct nvmlUtilization_t { unsigned int gpu, memory; };

  nvmlReturn_t (*p_nvmlInit_v2)(){};
  nvmlReturn_t (*p_nvmlShutdown)(){};
  nvmlReturn_t (*p_nvmlDeviceGetCount_v2)(unsigned int* count){};
  nvmlReturn_t (*p_nvmlDeviceGetHandleByIndex_v2)(unsigned int index, nvmlDevice_t* device){};
  nvmlReturn_t (*p_nvmlDeviceGetName)(nvmlDevice_t device, char* name, unsigned int length){};
  nvmlReturn_t (*p_nvmlDeviceGetMemoryInfo)(nvmlDevice_t device, nvmlMemory_t* mem){};
  nvmlReturn_t (*p_nvmlDeviceGetTemperature)(nvmlDevice_t device, unsigned int sensorType, unsigned int* temp){};
  nvmlReturn_t (*p_nvmlDeviceGetUtilizationRates)(nvmlDevice_t device, nvmlUtilization_t* utilization){};

  bool dlsym_all();
};

} // namespace sonitor::util
