#pragma once
#include "model/Snapshot.hpp"
#include <unordered_map>

namespace sonitor::collectors {

class NetCollector {
public:
  bool sample(sonitor::model::NetSnapshot& out);
  bool sample_at(sonitor::model::NetSnapshot& out, double ts);
private:
  struct Prev { uint64_t rx{}, tx{}; double ts{}; };
  std::unordered_map<std::string, Prev> last_;
};

// Loopback, container veths and bridges do not count toward host traffic.
[[nodiscard]] bool is_virtual_iface(const std::string& name);

} // namespace sonitor::collectors
