#include "collectors/DiskCollector.hpp"
#include "util/Procfs.hpp"
#include <chrono>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace std::chrono;

namespace sonitor::collectors {

static double now_secs() {
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

bool is_partition_of_listed(const std::string& name, const std::vector<std::string>& names) {
  for (const auto& base : names) {
    if (base.size() >= name.size() || name.rfind(base, 0) != 0) continue;
    std::string_view rest(name);
    rest.remove_prefix(base.size());
    if (rest.front() == 'p') rest.remove_prefix(1);
    if (rest.empty()) continue;
    bool digits = true;
    for (char c : rest) if (c < '0' || c > '9') { digits = false; break; }
    if (digits) return true;
  }
  return false;
}

bool DiskCollector::sample(sonitor::model::DiskSnapshot& out) {
  return sample_at(out, now_secs());
}

bool DiskCollector::sample_at(sonitor::model::DiskSnapshot& out, double ts) {
  auto txt_opt = sonitor::util::read_file_string("/proc/diskstats");
  if (!txt_opt) return false;
  out.total_read_bps = out.total_write_bps = 0.0;

  struct Row { std::string name; uint64_t rdsec{}, wrsec{}; };
  std::vector<Row> rows;
  std::vector<std::string> names;
  std::istringstream ss(*txt_opt); std::string line;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    unsigned major=0, minor=0; std::string name;
    uint64_t rd=0, rdmerge=0, rdsec=0, rdtm=0, wr=0, wrmerge=0, wrsec=0;
    if (!(ls>>major>>minor>>name>>rd>>rdmerge>>rdsec>>rdtm>>wr>>wrmerge>>wrsec)) continue;
    if (name.rfind("loop",0)==0 || name.rfind("ram",0)==0 || name.rfind("zram",0)==0) continue; // virtual
    rows.push_back(Row{name, rdsec, wrsec});
    names.push_back(name);
  }

  for (const auto& r : rows) {
    // Partitions are already counted by their parent device.
    if (is_partition_of_listed(r.name, names)) continue;
    auto it = last_.find(r.name);
    if (it != last_.end()) {
      auto& p = it->second; double dt = ts - p.ts; if (dt <= 0.0) dt = 1.0;
      uint64_t drd = r.rdsec >= p.rdsec ? r.rdsec - p.rdsec : 0;
      uint64_t dwr = r.wrsec >= p.wrsec ? r.wrsec - p.wrsec : 0;
      out.total_read_bps += static_cast<double>(drd * kSectorSize) / dt;
      out.total_write_bps += static_cast<double>(dwr * kSectorSize) / dt;
    }
    last_[r.name] = Prev{r.rdsec, r.wrsec, ts};
  }
  return true;
}

} // namespace sonitor::collectors
