#pragma once

namespace fixity {
class InterruptFlag;

// Installs a one-shot SIGINT/SIGTERM handler. The first signal sets `flag`,
// prints a notice on stderr and restores the default disposition, so a second
// signal terminates the process. `flag` must outlive the process run.
void install_interrupt_handler(InterruptFlag& flag);
}
