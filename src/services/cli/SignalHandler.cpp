#include "SignalHandler.hpp"

#include <csignal>
#include <unistd.h>

#include "core/audit/InterruptFlag.hpp"

static_assert(std::atomic<bool>::is_always_lock_free,
              "interrupt flag is written from a signal handler");

namespace {

fixity::InterruptFlag* g_flag = nullptr;

const char kNotice[] =
  "\nScript will exit after processing the current object.\n"
  "(Ctrl-C / Interrupt again to quit immediately)\n";

extern "C" void on_interrupt(int) {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  if (g_flag) g_flag->set();
  // write(2) is async-signal-safe; nothing to do if it fails
  ssize_t n = ::write(STDERR_FILENO, kNotice, sizeof(kNotice) - 1);
  (void)n;
}

} // namespace

namespace fixity {

void install_interrupt_handler(InterruptFlag& flag) {
  g_flag = &flag;
  std::signal(SIGINT, on_interrupt);
  std::signal(SIGTERM, on_interrupt);
}

} // namespace fixity
