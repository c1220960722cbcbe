#include "signal_handler.hpp"

#include <signal.h>

#include <cerrno>
#include <cstring>

namespace trellico {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<int> SignalHandler::received_signal_{0};

bool SignalHandler::install(std::string &error) {
    struct sigaction action {};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    for (int signal : {SIGINT, SIGTERM}) {
        if (sigaction(signal, &action, nullptr) != 0) {
            error = std::string("sigaction(") + strsignal(signal) + ") failed: " + std::strerror(errno);
            return false;
        }
    }

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(SIGPIPE, &ignore, nullptr) != 0) {
        error = std::string("sigaction(SIGPIPE) failed: ") + std::strerror(errno);
        return false;
    }
    return true;
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

int SignalHandler::received_signal() { return received_signal_.load(); }

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: only atomics and signal()
    if (shutdown_requested_.exchange(true)) {
        if (signal == SIGINT) {
            ::signal(SIGINT, SIG_DFL);
            ::raise(SIGINT);
        }
        return;
    }
    received_signal_.store(signal);
}

}  // namespace runtime
}  // namespace trellico
