#include "util/NvmlDyn.hpp"
#include "util/Log.hpp"
#include <dlfcn.h>
#include <string>
#include <vector>

namespace sonitor::util {

static const int NVML_SUCCESS = 0;
static const unsigned int NVML_TEMPERATURE_GPU = 0; // core sensor

NvmlDyn& NvmlDyn::instance() {
  static NvmlDyn inst;
  return inst;
}

NvmlDyn::~NvmlDyn() {
  if (initialized_ && p_nvmlShutdown) p_nvmlShutdown();
  if (handle_) ::dlclose(handle_);
}

bool NvmlDyn::load_once(const std::string& override_path) {
  if (loaded_) return handle_ != nullptr;
  loaded_ = true;

  std::vector<std::string> candidates;
  if (!override_path.empty()) {
    static const char* allowed_prefixes[] = {
      "/usr/lib", "/usr/lib64", "/usr/local/lib", "/usr/local/lib64", "/opt/nvidia", "/opt/cuda"
    };
    bool valid = false;
    for (const char* prefix : allowed_prefixes) {
      if (override_path.rfind(prefix, 0) == 0) { valid = true; break; }
    }
    if (valid) candidates.push_back(override_path);
    else log_warn("NVML", "nvml_path rejected (not under a system library prefix): %s", override_path.c_str());
  }
  candidates.emplace_back("libnvidia-ml.so.1");
  candidates.emplace_back("libnvidia-ml.so");

  for (const auto& lib : candidates) {
    handle_ = ::dlopen(lib.c_str(), RTLD_LAZY | RTLD_LOCAL);
    if (handle_) break;
  }
  if (!handle_) { log_debug("NVML", "libnvidia-ml not found"); return false; }
  if (!dlsym_all()) {
    log_warn("NVML", "libnvidia-ml is missing required symbols");
    ::dlclose(handle_); handle_ = nullptr; return false;
  }
  if (p_nvmlInit_v2() != NVML_SUCCESS) {
    log_info("NVML", "nvmlInit failed; using /proc and sysfs fallbacks");
    ::dlclose(handle_); handle_ = nullptr; return false;
  }
  initialized_ = true;
  return true;
}

bool NvmlDyn::dlsym_all() {
  auto L = [&](const char* sym){ return ::dlsym(handle_, sym); };
  p_nvmlInit_v2 = (nvmlReturn_t (*)())L("nvmlInit_v2");
  p_nvmlShutdown = (nvmlReturn_t (*)())L("nvmlShutdown");
  p_nvmlDeviceGetCount_v2 = (nvmlReturn_t (*)(unsigned int*))L("nvmlDeviceGetCount_v2");
  p_nvmlDeviceGetHandleByIndex_v2 = (nvmlReturn_t (*)(unsigned int, nvmlDevice_t*))L("nvmlDeviceGetHandleByIndex_v2");
  p_nvmlDeviceGetName = (nvmlReturn_t (*)(nvmlDevice_t, char*, unsigned int))L("nvmlDeviceGetName");
  p_nvmlDeviceGetMemoryInfo = (nvmlReturn_t (*)(nvmlDevice_t, nvmlMemory_t*))L("nvmlDeviceGetMemoryInfo");
  p_nvmlDeviceGetTemperature = (nvmlReturn_t (*)(nvmlDevice_t, unsigned int, unsigned int*))L("nvmlDeviceGetTemperature");
  p_nvmlDeviceGetUtilizationRates = (nvmlReturn_t (*)(nvmlDevice_t, nvmlUtilization_t*))L("nvmlDeviceGetUtilizationRates");
  // Core must-haves
  return p_nvmlInit_v2 && p_nvmlShutdown && p_nvmlDeviceGetCount_v2 && p_nvmlDeviceGetHandleByIndex_v2 && p_nvmlDeviceGetMemoryInfo;
}

bool NvmlDyn::available() const { return handle_ != nullptr && initialized_; }

bool NvmlDyn::read_device(sonitor::model::Gpu& out) {
  if (!available()) return false;
  unsigned int n = 0;
  if (p_nvmlDeviceGetCount_v2(&n) != NVML_SUCCESS || n == 0) return false;
  nvmlDevice_t dev{};
  if (p_nvmlDeviceGetHandleByIndex_v2(0, &dev) != NVML_SUCCESS) return false;
  nvmlMemory_t mem{};
  if (p_nvmlDeviceGetMemoryInfo(dev, &mem) != NVML_SUCCESS) return false;

  out.available = true;
  out.total_mb = mem.total / (1024ull * 1024ull);
  out.used_mb  = mem.used  / (1024ull * 1024ull);
  out.used_pct = out.total_mb ? (100.0 * static_cast<double>(out.used_mb) / static_cast<double>(out.total_mb)) : 0.0;
  if (p_nvmlDeviceGetName) {
    char name[96]; name[0] = '\0';
    if (p_nvmlDeviceGetName(dev, name, sizeof(name)) == NVML_SUCCESS && name[0]) out.name = name;
  }
  if (p_nvmlDeviceGetTemperature) {
    unsigned int tc = 0;
    if (p_nvmlDeviceGetTemperature(dev, NVML_TEMPERATURE_GPU, &tc) == NVML_SUCCESS) {
      out.has_temp = true; out.temp_c = static_cast<double>(tc);
    }
  }
  if (p_nvmlDeviceGetUtilizationRates) {
    nvmlUtilization_t ur{};
    if (p_nvmlDeviceGetUtilizationRates(dev, &ur) == NVML_SUCCESS) {
      out.has_util = true; out.util_pct = static_cast<double>(ur.gpu);
    }
  }
  return true;
}

} // namespace sonitor::util
