#pragma once
#include <cstdint>

namespace sonitor::model {

// Aggregate over physical interfaces.
struct NetSnapshot {
  double agg_rx_bps{};
  double agg_tx_bps{};
};

} // namespace sonitor::model
