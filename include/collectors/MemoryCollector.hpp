#pragma once
#include "model/Snapshot.hpp"

namespace sonitor::collectors {

class MemoryCollector {
public:
  bool sample(sonitor::model::Memory& out) const; // returns true on success
};

} // namespace sonitor::collectors
