#include "signal_handler.hpp"

#include <csignal>

namespace indiweb {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};

void SignalHandler::install() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

void SignalHandler::reset() { shutdown_requested_.store(false); }

void SignalHandler::handle_signal(int) {
    // Async-signal-safe: only atomic operations allowed
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace indiweb
