#include "collectors/GpuCollector.hpp"
#include "util/NvmlDyn.hpp"
#include "util/Procfs.hpp"
#include <charconv>
#include <sstream>
#include <string_view>

namespace sonitor::collectors {

static std::string trim(std::string s) {
  auto issp = [](unsigned char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
  while (!s.empty() && issp(s.front())) s.erase(s.begin());
  while (!s.empty() && issp(s.back())) s.pop_back();
  return s;
}

// First integer after "<key>" and ':' in a "Key : 1234 MiB" style text.
static bool field_u64(const std::string& txt, std::string_view key, uint64_t& out) {
  size_t pos = txt.find(key);
  if (pos == std::string::npos) return false;
  size_t colon = txt.find(':', pos);
  if (colon == std::string::npos) return false;
  size_t b = colon + 1;
  while (b < txt.size() && (txt[b] < '0' || txt[b] > '9') && txt[b] != '\n') ++b;
  auto [ptr, ec] = std::from_chars(txt.data() + b, txt.data() + txt.size(), out);
  return ec == std::errc{} && ptr != txt.data() + b;
}

std::string short_gpu_name(std::string name) {
  for (std::string_view prefix : {"NVIDIA ", "GeForce "}) {
    if (name.rfind(prefix, 0) == 0) name.erase(0, prefix.size());
  }
  return name;
}

static bool read_nvidia_proc(sonitor::model::Gpu& out) {
  const std::string root = "/proc/driver/nvidia/gpus";
  for (const auto& id : sonitor::util::list_dir(root)) {
    const std::string dir = root + "/" + id;
    auto mem = sonitor::util::read_file_string(dir + "/fb_memory_usage");
    if (!mem) continue;
    uint64_t total_mb = 0, used_mb = 0;
    if (!field_u64(*mem, "Total", total_mb) || total_mb == 0) continue;
    field_u64(*mem, "Used", used_mb);
    std::string name = id;
    if (auto info = sonitor::util::read_file_string(dir + "/information")) {
      std::istringstream in(*info);
      std::string line;
      while (std::getline(in, line)) {
        if (line.rfind("Model:", 0) == 0) { name = trim(line.substr(6)); break; }
      }
    }
    out.available = true;
    out.name = name;
    out.total_mb = total_mb;
    out.used_mb = used_mb;
    out.used_pct = 100.0 * static_cast<double>(used_mb) / static_cast<double>(total_mb);
    return true;
  }
  return false;
}

static bool read_amd_sysfs(sonitor::model::Gpu& out) {
  const std::string drm = "/sys/class/drm";
  for (const auto& card : sonitor::util::list_dir(drm)) {
    if (!card.starts_with("card") || card.find('-') != std::string::npos) continue; // skip connectors
    const std::string dev = drm + "/" + card + "/device";
    auto tot = sonitor::util::read_file_int(dev + "/mem_info_vram_total");
    auto usd = sonitor::util::read_file_int(dev + "/mem_info_vram_used");
    if (!tot || !usd || *tot <= 0) continue;
    out.available = true;
    // Values are bytes
    out.total_mb = static_cast<uint64_t>(*tot) / (1024ull * 1024ull);
    out.used_mb  = static_cast<uint64_t>(*usd < 0 ? 0 : *usd) / (1024ull * 1024ull);
    out.used_pct = out.total_mb ? (100.0 * static_cast<double>(out.used_mb) / static_cast<double>(out.total_mb)) : 0.0;
    if (auto busy = sonitor::util::read_file_int(dev + "/gpu_busy_percent")) {
      out.has_util = true; out.util_pct = static_cast<double>(*busy);
    }
    out.name = card;
    if (auto ue = sonitor::util::read_file_string(dev + "/uevent")) {
      std::istringstream in(*ue);
      std::string line, driver, pciid;
      while (std::getline(in, line)) {
        if (line.rfind("DRIVER=",0)==0) driver = trim(line.substr(7));
        else if (line.rfind("PCI_ID=",0)==0) pciid = trim(line.substr(7));
      }
      if (!driver.empty()) out.name = pciid.empty() ? driver : driver + " (" + pciid + ")";
    }
    // edge temperature from the first hwmon temp1_input
    for (const auto& hm : sonitor::util::list_dir(dev + "/hwmon")) {
      if (auto mdeg = sonitor::util::read_file_int(dev + "/hwmon/" + hm + "/temp1_input")) {
        out.has_temp = true; out.temp_c = static_cast<double>(*mdeg) / 1000.0;
        break;
      }
    }
    return true;
  }
  return false;
}

bool GpuCollector::sample(sonitor::model::Gpu& out) const {
  out = {};
  if (opts_.use_nvml) {
    auto& nv = sonitor::util::NvmlDyn::instance();
    if (nv.load_once(opts_.nvml_path) && nv.read_device(out)) return true;
    out = {};
  }
  if (read_nvidia_proc(out)) return true;
  out = {};
  if (read_amd_sysfs(out)) return true;
  out = {};
  return false;
}

} // namespace sonitor::collectors
