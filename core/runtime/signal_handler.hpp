#pragma once

#include <atomic>
#include <string>

namespace trellico {
namespace runtime {

/**
 * @brief SIGINT/SIGTERM set a flag that Runtime::run() polls
 *
 * A second SIGINT while shutdown is still in progress terminates the process
 * immediately (default disposition). SIGPIPE is ignored so a client dropping
 * an SSE stream surfaces as a write error instead.
 */
class SignalHandler {
public:
    static bool install(std::string &error);

    static bool is_shutdown_requested();

    // Number of the first shutdown signal, 0 if none
    static int received_signal();

private:
    static void handle_signal(int signal);

    static std::atomic<bool> shutdown_requested_;
    static std::atomic<int> received_signal_;
};

}  // namespace runtime
}  // namespace trellico
