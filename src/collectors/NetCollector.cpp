#include "collectors/NetCollector.hpp"
#include "util/Procfs.hpp"
#include <chrono>
#include <sstream>
#include <string>

using namespace std::chrono;

namespace sonitor::collectors {

static double now_secs() {
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

bool is_virtual_iface(const std::string& name) {
  return name == "lo" || name.rfind("veth",0)==0 || name.rfind("docker",0)==0 ||
         name.rfind("br-",0)==0 || name.rfind("virbr",0)==0;
}

bool NetCollector::sample(sonitor::model::NetSnapshot& out) {
  return sample_at(out, now_secs());
}

bool NetCollector::sample_at(sonitor::model::NetSnapshot& out, double ts) {
  auto txt_opt = sonitor::util::read_file_string("/proc/net/dev");
  if (!txt_opt) return false;
  out.agg_rx_bps = out.agg_tx_bps = 0.0;
  std::istringstream ss(*txt_opt);
  std::string line; int line_no = 0;
  while (std::getline(ss, line)) {
    ++line_no; if (line_no <= 2) continue; // headers
    // "  eth0: rx_bytes packets errs drop fifo frame compressed multicast tx_bytes ..."
    auto colon = line.find(':'); if (colon == std::string::npos) continue;
    std::string name = line.substr(0, colon);
    while (!name.empty() && name.front() == ' ') name.erase(name.begin());
    if (is_virtual_iface(name)) continue;
    std::istringstream ns(line.substr(colon+1));
    uint64_t rx_bytes=0, tx_bytes=0;
    ns >> rx_bytes;
    for (int i=0;i<7;i++){ uint64_t tmp; ns >> tmp; }
    ns >> tx_bytes;
    if (!ns) continue;
    auto it = last_.find(name);
    if (it != last_.end()) {
      const auto& p = it->second;
      double dt = ts - p.ts; if (dt <= 0.0) dt = 1.0;
      // counter reset (interface re-created) reads as zero traffic
      if (rx_bytes >= p.rx) out.agg_rx_bps += static_cast<double>(rx_bytes - p.rx) / dt;
      if (tx_bytes >= p.tx) out.agg_tx_bps += static_cast<double>(tx_bytes - p.tx) / dt;
    }
    last_[name] = Prev{rx_bytes, tx_bytes, ts};
  }
  return true;
}

} // namespace sonitor::collectors
