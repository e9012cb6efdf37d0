#include "app/Sampler.hpp"
#include "app/Settings.hpp"
#include "model/Snapshot.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Log.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using sonitor::util::log_error;
using sonitor::util::log_warn;

namespace {

void print_usage() {
  std::cout << "Usage: sonitor [--iterations N] [--interval-ms MS] [--once]\n"
               "               [--theme NAME] [--layout NAME] [--mode NAME] [--config PATH]\n";
  std::cout << "Keys: q quit  v style  l layout  t theme  1-8 select  m tile style\n"
               "      r reset tile  [ ] move tile  a autostart  h help\n";
}

std::optional<int> parse_int_arg(const char* s) {
  try { return std::stoi(s); } catch (const std::exception&) { return std::nullopt; }
}

struct CliOptions {
  int iterations{0};
  std::optional<int> interval_ms;
  bool once{false};
  std::string theme, layout, mode, config_path;
};

// Returns an exit code when the process should stop right away.
std::optional<int> parse_cli(int argc, char** argv, CliOptions& o) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    bool has_next = i + 1 < argc;
    if (a == "--iterations" && has_next) {
      auto v = parse_int_arg(argv[++i]);
      if (!v) { std::cerr << "sonitor: invalid --iterations value\n"; return 2; }
      o.iterations = *v;
    } else if (a == "--interval-ms" && has_next) {
      auto v = parse_int_arg(argv[++i]);
      if (!v) { std::cerr << "sonitor: invalid --interval-ms value\n"; return 2; }
      o.interval_ms = *v;
    } else if (a == "--once") {
      o.once = true;
    } else if (a == "--theme" && has_next) {
      o.theme = argv[++i];
    } else if (a == "--layout" && has_next) {
      o.layout = argv[++i];
    } else if (a == "--mode" && has_next) {
      o.mode = argv[++i];
    } else if (a == "--config" && has_next) {
      o.config_path = argv[++i];
    } else if (a == "-h" || a == "--help") {
      print_usage();
      return 0;
    } else {
      std::cerr << "sonitor: unknown argument: " << a << "\n";
      print_usage();
      return 2;
    }
  }
  return std::nullopt;
}

// Command-line choices win over the file for this session.
void apply_cli_overrides(const CliOptions& o, sonitor::app::Settings& s) {
  if (!o.layout.empty()) {
    if (auto l = sonitor::model::parse_layout(o.layout)) s.set_layout(*l);
    else log_warn("Main", "unknown layout '%s' ignored", o.layout.c_str());
  }
  if (!o.mode.empty()) {
    if (auto m = sonitor::model::parse_vis_mode(o.mode)) s.set_vis_mode(*m);
    else log_warn("Main", "unknown style '%s' ignored", o.mode.c_str());
  }
  if (!o.theme.empty() && !s.set_theme(o.theme))
    log_warn("Main", "unknown theme '%s' ignored", o.theme.c_str());
}

void draw(sonitor::app::Sampler& sampler, sonitor::model::Snapshot& snap, bool refresh,
          const sonitor::app::Settings& settings, const sonitor::ui::WidgetState& st) {
  if (refresh && !sampler.sample(snap)) log_warn("Main", "no system source could be read");
  auto frame = sonitor::ui::make_frame(settings, st.selected, st.show_help);
  frame.status = st.status;
  auto lines = sonitor::ui::render_widget(frame, sonitor::app::tile_readings(snap), sonitor::ui::term_cols(),
                                         sonitor::ui::term_rows());
  sonitor::ui::present(lines);
}

} // namespace

int main(int argc, char** argv) {
  CliOptions cli;
  if (auto rc = parse_cli(argc, argv, cli)) return *rc;

  std::string cfg_path = cli.config_path.empty() ? sonitor::ui::config_file_path() : cli.config_path;
  auto cfg = sonitor::ui::load_config(cfg_path);
  sonitor::util::set_log_level(sonitor::util::parse_log_level(cfg.log_level));
  int interval_ms = sonitor::ui::clamp_interval_ms(cli.interval_ms.value_or(cfg.ui.interval_ms));

  sonitor::app::Settings settings(cfg_path);
  settings.apply_env_defaults();
  (void)settings.load();
  apply_cli_overrides(cli, settings);

  sonitor::collectors::GpuOptions gpu_opts;
  gpu_opts.use_nvml = !cfg.nvidia.disable_nvml;
  gpu_opts.nvml_path = cfg.nvidia.nvml_path;
  sonitor::app::Sampler sampler(gpu_opts);
  sampler.prime();

  sonitor::model::Snapshot snap;
  if (cli.once) {
    std::this_thread::sleep_for(std::chrono::milliseconds(sonitor::ui::kMinIntervalMs));
    if (!sampler.sample(snap)) log_warn("Main", "no system source could be read");
    auto frame = sonitor::ui::make_frame(settings, -1, false);
    for (const auto& line : sonitor::ui::render_widget(frame, sonitor::app::tile_readings(snap),
                                                       sonitor::ui::term_cols()))
      std::cout << line << "\n";
    return 0;
  }

  settings.set_autosave(true);
  std::signal(SIGINT, sonitor::ui::on_signal_stop);
  std::signal(SIGTERM, sonitor::ui::on_signal_stop);

  bool use_alt = cfg.ui.alt_screen && sonitor::ui::tty_stdout();
  if (use_alt) (void)sonitor::util::set_log_file(sonitor::util::default_log_path());
  {
    sonitor::ui::RawTermGuard raw{};
    sonitor::ui::CursorGuard curs{};
    sonitor::ui::AltScreenGuard alt{use_alt};
    std::atexit(&sonitor::ui::on_atexit_restore);
    if (use_alt) sonitor::ui::best_effort_write(STDOUT_FILENO, "\x1B[2J\x1B[H", 7);

    int iterations = cli.iterations > 0 ? cli.iterations : INT_MAX;
    bool interactive = ::isatty(STDIN_FILENO) == 1;
    sonitor::ui::WidgetState st;
    using clock = std::chrono::steady_clock;
    for (int i = 0; i < iterations && !sonitor::ui::g_stop.load() && !st.quit; ++i) {
      try {
        draw(sampler, snap, true, settings, st);
      } catch (const std::exception& e) {
        log_error("Main", "frame update failed: %s", e.what());
      }
      auto deadline = clock::now() + std::chrono::milliseconds(interval_ms);
      while (!sonitor::ui::g_stop.load() && !st.quit) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (left <= 0) break;
        if (!interactive) { std::this_thread::sleep_for(std::chrono::milliseconds(std::min<long long>(left, 100))); continue; }
        if (!sonitor::ui::has_input_available(static_cast<int>(left))) continue;
        auto actions = sonitor::ui::read_actions();
        if (actions.empty()) continue;
        try {
          for (const auto& a : actions) sonitor::ui::apply_action(a, st, settings);
          if (!st.quit) draw(sampler, snap, false, settings, st);
        } catch (const std::exception& e) {
          log_error("Main", "key handling failed: %s", e.what());
        }
      }
    }
  }
  if (use_alt) (void)sonitor::util::set_log_file({});
  return 0;
}
