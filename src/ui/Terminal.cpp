#include "ui/Terminal.hpp"
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace sonitor::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_alt_in_use{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* nothing useful to do from a signal handler */ }
}

void restore_terminal_minimal() {
  // Async-signal-safe: leave alt screen, show cursor, reset SGR
  const char* alt_off = "\x1B[?1049l";
  const char* show_cur = "\x1B[?25h";
  const char* reset = "\x1B[0m";
  if (g_alt_in_use.load()) best_effort_write(STDOUT_FILENO, alt_off, std::char_traits<char>::length(alt_off));
  best_effort_write(STDOUT_FILENO, show_cur, std::char_traits<char>::length(show_cur));
  best_effort_write(STDOUT_FILENO, reset, std::char_traits<char>::length(reset));
}

void on_signal_stop(int){ restore_terminal_minimal(); g_stop.store(true); }

void on_atexit_restore(){
  std::fflush(stdout);
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) tcdrain(STDOUT_FILENO);
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

static std::string lower_env(const char* name) {
  const char* v = std::getenv(name);
  if (!v) return {};
  std::string s = v;
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool truecolor_capable() {
  auto s = lower_env("COLORTERM");
  return s.find("truecolor") != std::string::npos || s.find("24bit") != std::string::npos;
}

bool use_unicode() {
  for (const char* name : {"LC_ALL", "LC_CTYPE", "LANG"}) {
    auto s = lower_env(name);
    if (s.empty()) continue;
    return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
  }
  return false;
}

int term_cols() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  if (const char* c = std::getenv("COLUMNS"); c && *c) {
    int v = std::atoi(c);
    if (v > 0) return std::max(20, v);
  }
  return 80;
}

int term_rows() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
    return ws.ws_row;
  if (const char* env = std::getenv("LINES")) { int r = std::atoi(env); if (r > 0) return r; }
  return 24;
}

std::string sgr(const char* code) {
  if (!tty_stdout()) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset() { return sgr("0"); }
std::string sgr_bold() { return sgr("1"); }
std::string sgr_reverse() { return sgr("7"); }

std::string sgr_palette_idx(int idx) {
  if (!tty_stdout()) return {};
  idx = std::clamp(idx, 0, 255);
  return std::string("\x1B[38;5;") + std::to_string(idx) + "m";
}

std::string sgr_truecolor(int r, int g, int b) {
  if (!tty_stdout()) return {};
  r = std::clamp(r,0,255); g = std::clamp(g,0,255); b = std::clamp(b,0,255);
  return std::string("\x1B[38;2;") + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m";
}

std::string sgr_fg(const Rgb& c) {
  auto px = to_rgb8(c);
  if (truecolor_capable()) return sgr_truecolor(px.r, px.g, px.b);
  auto cube = [](int v) { return (v * 5 + 127) / 255; }; // 0..5
  return sgr_palette_idx(16 + 36 * cube(px.r) + 6 * cube(px.g) + cube(px.b));
}

RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) == 1) {
    if (tcgetattr(STDIN_FILENO, &old_) == 0) {
      termios neo = old_;
      neo.c_lflag &= ~(ICANON | ECHO);
      neo.c_cc[VMIN] = 0;
      neo.c_cc[VTIME] = 0;
      tcsetattr(STDIN_FILENO, TCSANOW, &neo);
      old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
      fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
      active_ = true;
    }
  }
}

RawTermGuard::~RawTermGuard() {
  if (active_) {
    tcsetattr(STDIN_FILENO, TCSANOW, &old_);
    fcntl(STDIN_FILENO, F_SETFL, old_flags_);
  }
}

CursorGuard::CursorGuard() {
  if (tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?25l", 6);
    active_ = true;
  }
}

CursorGuard::~CursorGuard() {
  if (active_) best_effort_write(STDOUT_FILENO, "\x1B[?25h", 6);
}

AltScreenGuard::AltScreenGuard(bool enable) {
  if (enable && tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049h", 8);
    active_ = true;
    g_alt_in_use.store(true);
  }
}

AltScreenGuard::~AltScreenGuard() {
  if (active_) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049l", 8);
    g_alt_in_use.store(false);
  }
}

} // namespace sonitor::ui
