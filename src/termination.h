#pragma once

namespace uvk {

// Signal handling for `uvk launch`. SIGTERM and SIGHUP are recorded as a stop request
// (a second one exits immediately with 128 + signal). SIGINT is counted as an interrupt
// to forward to the kernel, matching the kernelspec's "signal" interrupt mode.
void termination_handler_install();

// Signal number of the first SIGTERM/SIGHUP received, or 0.
int termination_requested();

// Number of SIGINTs received since the last call.
int termination_take_interrupts();

// Clears recorded signals. Used by tests.
void termination_reset();

}  // namespace uvk
