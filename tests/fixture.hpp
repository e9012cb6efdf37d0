#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <unistd.h>

// Temporary directory used as /proc and /sys root (and as XDG config home)
// for one test. Removed again on scope exit.
class FakeRoot {
public:
  explicit FakeRoot(const std::string& tag) {
    root_ = std::filesystem::temp_directory_path() /
            ("sonitor_test_" + tag + "_" + std::to_string(::getpid()));
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_ / "proc", ec);
    std::filesystem::create_directories(root_ / "sys", ec);
    ::setenv("SONITOR_PROC_ROOT", root_.c_str(), 1);
    ::setenv("SONITOR_SYS_ROOT", root_.c_str(), 1);
  }
  ~FakeRoot() {
    ::unsetenv("SONITOR_PROC_ROOT");
    ::unsetenv("SONITOR_SYS_ROOT");
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }
  FakeRoot(const FakeRoot&) = delete;
  FakeRoot& operator=(const FakeRoot&) = delete;

  // Write `content` to root-relative `rel`, creating parents.
  void write(const std::string& rel, const std::string& content) const {
    auto p = root_ / rel;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream(p, std::ios::trunc) << content;
  }

  [[nodiscard]] const std::filesystem::path& path() const { return root_; }

private:
  std::filesystem::path root_;
};

// Sets an environment variable for the enclosing scope.
class ScopedEnv {
public:
  ScopedEnv(const char* name, const std::string& value) : name_(name) {
    if (const char* old = std::getenv(name)) { had_ = true; old_ = old; }
    ::setenv(name, value.c_str(), 1);
  }
  ~ScopedEnv() {
    if (had_) ::setenv(name_.c_str(), old_.c_str(), 1);
    else ::unsetenv(name_.c_str());
  }
  ScopedEnv(const ScopedEnv&) = delete;
  ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
  std::string name_;
  std::string old_;
  bool had_{false};
};
