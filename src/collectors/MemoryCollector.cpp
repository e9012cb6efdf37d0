#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string_view>

namespace sonitor::collectors {

static inline uint64_t parse_kb(std::string_view s) {
  uint64_t v = 0;
  // strip unit on the right ("kB") and padding on the left
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1);
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

bool MemoryCollector::sample(sonitor::model::Memory& out) const {
  auto txt_opt = sonitor::util::read_file_string("/proc/meminfo");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;

  uint64_t mem_total = 0, mem_free = 0, mem_avail = 0, buffers = 0, cached = 0, swap_total = 0, swap_free = 0;
  bool have_avail = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("MemTotal:")) mem_total = parse_kb(line.substr(9));
    else if (line.starts_with("MemFree:")) mem_free = parse_kb(line.substr(8));
    else if (line.starts_with("MemAvailable:")) { mem_avail = parse_kb(line.substr(13)); have_avail = true; }
    else if (line.starts_with("Buffers:")) buffers = parse_kb(line.substr(8));
    else if (line.starts_with("Cached:")) cached = parse_kb(line.substr(7));
    else if (line.starts_with("SwapTotal:")) swap_total = parse_kb(line.substr(10));
    else if (line.starts_with("SwapFree:")) swap_free = parse_kb(line.substr(9));
    start = end + 1;
  }
  if (mem_total == 0) return false;

  out.total_kb = mem_total;
  if (have_avail) {
    out.used_kb = (mem_total > mem_avail) ? (mem_total - mem_avail) : 0;
  } else {
    uint64_t sum = mem_free + buffers + cached;
    out.used_kb = (mem_total > sum) ? (mem_total - sum) : 0;
  }
  out.used_pct = 100.0 * static_cast<double>(out.used_kb) / static_cast<double>(out.total_kb);
  out.swap_total_kb = swap_total;
  out.swap_used_kb  = (swap_total > swap_free) ? (swap_total - swap_free) : 0;
  out.swap_used_pct = swap_total ? (100.0 * static_cast<double>(out.swap_used_kb) / static_cast<double>(swap_total)) : 0.0;
  return true;
}

} // namespace sonitor::collectors
