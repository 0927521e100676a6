#pragma once
#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>

namespace fixity {

// Single-line progress display, redrawn in place with '\r'.
class ProgressBar {
public:
  ProgressBar(std::ostream& os, std::string message, std::size_t total);
  ~ProgressBar();

  void update(std::size_t current);
  void finish();

  // True when stderr is attached to a terminal.
  static bool stderr_is_tty();

private:
  void render();

  std::ostream& os_;
  std::string message_;
  std::size_t total_;
  std::size_t current_ = 0;
  bool active_ = true;
  std::chrono::steady_clock::time_point lastUpdate_;
  static constexpr int kUpdateIntervalMs = 100;
  static constexpr int kWidth = 30;
};

} // namespace fixity
