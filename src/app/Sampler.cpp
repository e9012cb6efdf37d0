#include "app/Sampler.hpp"
#include "util/Log.hpp"
#include <cstdio>

namespace sonitor::app {

using sonitor::model::TileId;
using sonitor::model::tile_index;

void Sampler::prime() {
  sonitor::model::CpuSnapshot cpu;
  sonitor::model::DiskSnapshot disk;
  sonitor::model::NetSnapshot net;
  if (!cpu_.sample(cpu)) sonitor::util::log_info("Sampler", "/proc/stat unavailable");
  if (!disk_.sample(disk)) sonitor::util::log_info("Sampler", "/proc/diskstats unavailable");
  if (!net_.sample(net)) sonitor::util::log_info("Sampler", "/proc/net/dev unavailable");
}

bool Sampler::sample(sonitor::model::Snapshot& out) {
  int ok = 0;
  if (cpu_.sample(out.cpu)) ++ok; else out.cpu = {};
  if (mem_.sample(out.mem)) ++ok; else out.mem = {};
  if (gpu_.sample(out.gpu)) ++ok;
  if (disk_.sample(out.disk)) ++ok; else out.disk = {};
  if (net_.sample(out.net)) ++ok; else out.net = {};
  if (thermal_.sample(out.thermal)) ++ok;
  out.seq = ++seq_;
  return ok > 0;
}

static std::string gib_pair(uint64_t used_kb, uint64_t total_kb) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.1f/%.0fG",
                static_cast<double>(used_kb) / (1024.0 * 1024.0),
                static_cast<double>(total_kb) / (1024.0 * 1024.0));
  return buf;
}

sonitor::model::TileReadings tile_readings(const sonitor::model::Snapshot& s) {
  sonitor::model::TileReadings r{};

  auto& cpu = r[tile_index(TileId::Cpu)];
  cpu.percent = s.cpu.usage_pct;
  if (s.cpu.has_freq) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.0fMHz", s.cpu.freq_mhz);
    cpu.details = buf;
  }

  auto& ram = r[tile_index(TileId::Ram)];
  ram.percent = s.mem.used_pct;
  ram.available = s.mem.total_kb > 0;
  ram.details = ram.available ? gib_pair(s.mem.used_kb, s.mem.total_kb) : "N/A";

  auto& swap = r[tile_index(TileId::Swap)];
  swap.percent = s.mem.swap_used_pct;
  swap.details = gib_pair(s.mem.swap_used_kb, s.mem.swap_total_kb);

  auto& gpu = r[tile_index(TileId::Gpu)];
  auto& vram = r[tile_index(TileId::Vram)];
  auto& temp = r[tile_index(TileId::Temp)];
  if (s.gpu.available) {
    gpu.percent = s.gpu.has_util ? s.gpu.util_pct : 0.0;
    gpu.details = sonitor::collectors::short_gpu_name(s.gpu.name);
    vram.percent = s.gpu.used_pct;
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%llu/%lluM",
                  static_cast<unsigned long long>(s.gpu.used_mb),
                  static_cast<unsigned long long>(s.gpu.total_mb));
    vram.details = buf;
  } else {
    gpu.available = vram.available = false;
    gpu.details = vram.details = "N/A";
  }
  if (s.gpu.available && s.gpu.has_temp) {
    temp.percent = s.gpu.temp_c;
    temp.details = "GPU";
  } else if (s.thermal.has_temp) {
    temp.percent = s.thermal.cpu_max_c;
    temp.details = "CPU";
  } else {
    temp.available = false;
    temp.details = "N/A";
  }

  auto& disk = r[tile_index(TileId::Disk)];
  disk.read_bps = s.disk.total_read_bps > 0.0 ? s.disk.total_read_bps : 0.0;
  disk.write_bps = s.disk.total_write_bps > 0.0 ? s.disk.total_write_bps : 0.0;

  auto& net = r[tile_index(TileId::Net)];
  net.read_bps = s.net.agg_rx_bps > 0.0 ? s.net.agg_rx_bps : 0.0;
  net.write_bps = s.net.agg_tx_bps > 0.0 ? s.net.agg_tx_bps : 0.0;
  return r;
}

} // namespace sonitor::app
