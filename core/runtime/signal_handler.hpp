#pragma once

#include <atomic>

namespace indiweb {
namespace runtime {

// Process-wide shutdown flag set from SIGINT/SIGTERM.
// SIGPIPE is ignored so writes to a FIFO or socket whose reader went away
// fail with EPIPE instead of killing the process.
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Clears the flag (tests)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace indiweb
