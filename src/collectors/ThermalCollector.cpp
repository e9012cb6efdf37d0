#include "collectors/ThermalCollector.hpp"
#include "util/Procfs.hpp"
#include <string>

namespace sonitor::collectors {

static void take_max(sonitor::model::Thermal& out, long long mdeg) {
  double c = static_cast<double>(mdeg) / 1000.0;
  if (!out.has_temp || c > out.cpu_max_c) { out.has_temp = true; out.cpu_max_c = c; }
}

bool ThermalCollector::sample(sonitor::model::Thermal& out) {
  out = {};
  // hwmon: /sys/class/hwmon/hwmon*/temp*_input (millidegrees C)
  for (const auto& hw : sonitor::util::list_dir("/sys/class/hwmon")) {
    const std::string dir = "/sys/class/hwmon/" + hw;
    for (const auto& name : sonitor::util::list_dir(dir)) {
      if (name.rfind("temp", 0) != 0 || name.find("_input") == std::string::npos) continue;
      if (auto v = sonitor::util::read_file_int(dir + "/" + name)) take_max(out, *v);
    }
  }
  if (!out.has_temp) {
    for (const auto& z : sonitor::util::list_dir("/sys/class/thermal")) {
      if (z.rfind("thermal_zone", 0) != 0) continue;
      if (auto v = sonitor::util::read_file_int("/sys/class/thermal/" + z + "/temp")) take_max(out, *v);
    }
  }
  return out.has_temp;
}

} // namespace sonitor::collectors
