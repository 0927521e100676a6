#include "ProgressBar.hpp"

#include <iomanip>
#include <sstream>
#include <unistd.h>
#include <utility>

namespace fixity {

ProgressBar::ProgressBar(std::ostream& os, std::string message, std::size_t total)
  : os_(os), message_(std::move(message)), total_(total),
    lastUpdate_(std::chrono::steady_clock::now()) {
  render();
}

ProgressBar::~ProgressBar() {
  if (active_) finish();
}

bool ProgressBar::stderr_is_tty() {
  return ::isatty(STDERR_FILENO) != 0;
}

void ProgressBar::update(std::size_t current) {
  if (!active_) return;
  current_ = current;

  auto now = std::chrono::steady_clock::now();
  auto elapsed =
    std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate_).count();
  // always draw the last step so the bar ends at 100%
  if (elapsed >= kUpdateIntervalMs || current_ >= total_) {
    lastUpdate_ = now;
    render();
  }
}

void ProgressBar::finish() {
  if (!active_) return;
  // clear the line so the summary starts clean
  os_ << "\r\033[K" << std::flush;
  active_ = false;
}

void ProgressBar::render() {
  std::ostringstream oss;
  oss << "\r" << message_ << " ";
  if (total_ > 0) {
    const std::size_t filled = current_ >= total_ ? kWidth : (current_ * kWidth) / total_;
    const int percent = static_cast<int>((current_ * 100) / total_);
    oss << "[" << std::string(filled, '#') << std::string(kWidth - filled, ' ') << "] "
        << std::setw(3) << percent << "% (" << current_ << "/" << total_ << ")";
  } else {
    oss << "(" << current_ << ")";
  }
  os_ << oss.str() << std::flush;
}

} // namespace fixity
