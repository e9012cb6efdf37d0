#pragma once
#include "model/Snapshot.hpp"

namespace sonitor::collectors {

class ThermalCollector {
public:
  // Hottest hwmon sensor, falling back to thermal zones. False if none.
  bool sample(sonitor::model::Thermal& out);
};

} // namespace sonitor::collectors
