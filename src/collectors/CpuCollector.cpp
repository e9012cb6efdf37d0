#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"
#include <charconv>
#include <exception>
#include <sstream>
#include <string>
#include <string_view>

namespace sonitor::collectors {

static void parse_cpu_line(std::string_view line, sonitor::model::CpuTimes& out) {
  // "cpu  user nice system idle iowait irq softirq steal ..."
  auto pos = line.find(' ');
  if (pos == std::string_view::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

static double busy_pct(const sonitor::model::CpuTimes& now, const sonitor::model::CpuTimes& prev) {
  // Counters only move forward; a smaller value means the source was reset.
  if (now.total() <= prev.total() || now.work() < prev.work()) return 0.0;
  double td = static_cast<double>(now.total() - prev.total());
  double wd = static_cast<double>(now.work() - prev.work());
  double pct = 100.0 * wd / td;
  return pct > 100.0 ? 100.0 : pct;
}

bool CpuCollector::sample(sonitor::model::CpuSnapshot& out) {
  auto txt_opt = sonitor::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  sonitor::model::CpuTimes agg{};
  bool have_agg = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); have_agg = true; break; }
    start = end + 1;
  }
  if (!have_agg) return false;

  double usage = has_last_ ? busy_pct(agg, last_total_) : 0.0;
  last_total_ = agg; has_last_ = true;
  out.total_times = agg; out.usage_pct = usage;
  auto mhz = read_cpu_freq_mhz();
  out.has_freq = mhz.has_value();
  out.freq_mhz = mhz.value_or(0.0);
  return true;
}

std::optional<double> read_cpu_freq_mhz() {
  if (auto khz = sonitor::util::read_file_int("/sys/devices/system/cpu/cpu0/cpufreq/scaling_cur_freq"); khz && *khz > 0)
    return static_cast<double>(*khz) / 1000.0;
  auto txt = sonitor::util::read_file_string("/proc/cpuinfo");
  if (!txt) return std::nullopt;
  std::istringstream ss(*txt);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu MHz", 0) != 0) continue;
    auto pos = line.find(':');
    if (pos == std::string::npos) continue;
    try { return std::stod(line.substr(pos + 1)); } catch (const std::exception&) { return std::nullopt; }
  }
  return std::nullopt;
}

} // namespace sonitor::collectors
