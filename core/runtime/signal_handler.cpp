#include "signal_handler.hpp"

#include <csignal>

namespace devauth {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};

void SignalHandler::install() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

void SignalHandler::handle_signal(int) {
    // Async-signal-safe: atomic store only
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace devauth
