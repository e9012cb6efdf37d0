#pragma once

namespace sonitor::model {

struct Thermal {
  bool   has_temp{false};
  double cpu_max_c{0.0};
};

} // namespace sonitor::model
