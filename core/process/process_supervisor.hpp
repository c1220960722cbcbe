#pragma once

/**
 * @file process_supervisor.hpp
 * @brief Starts, tracks and cancels provider CLI invocations on pseudo-terminals
 *
 * Each accepted start() gets a fresh process id, a registry entry and one
 * dedicated worker thread that owns the terminal and the child for its whole
 * lifetime. The worker streams output chunks to the event sink until EOF,
 * cancellation or a read error, reaps the child, removes the registry entry and
 * then publishes exactly one terminal event (exit or error).
 *
 * Cancellation is cooperative: stop() only sets the process's token; the worker
 * checks it before every read and SIGKILLs the child when set. Reads wait at
 * most cancel_poll_ms, so a silent child is still cancelled promptly.
 */

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "events/event_sink.hpp"
#include "process_registry.hpp"
#include "provider/provider_catalog.hpp"
#include "utf8.hpp"

namespace trellico {
namespace process {

enum class ProcessMode {
    MULTI,  // Unbounded concurrent processes
    SINGLE  // Legacy: at most one process, addressed by stop() without id
};

bool parse_process_mode(const std::string &value, ProcessMode &out);
const char *process_mode_to_string(ProcessMode mode);

struct SupervisorConfig {
    ProcessMode mode = ProcessMode::MULTI;
    size_t read_chunk_bytes = 256;
    int cancel_poll_ms = 100;
    Utf8Policy utf8_policy = Utf8Policy::DROP;
    unsigned short pty_rows = 24;
    unsigned short pty_cols = 80;
};

struct StartRequest {
    std::string provider_id;
    std::string message;
    std::string folder_path;
    std::optional<std::string> resume_session;
};

class ProcessSupervisor {
public:
    ProcessSupervisor(const provider::ProviderCatalog &catalog, events::IEventSink &sink,
                      SupervisorConfig config = SupervisorConfig{});

    // Cancels every process and joins every worker
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    /**
     * @brief Register and launch one provider invocation (non-blocking)
     *
     * Synchronous failures: empty message/folder, unknown provider, capacity
     * reached (single mode) or supervisor shutting down. Everything that can go
     * wrong after that (binary missing, spawn, I/O) arrives as an error event.
     *
     * @return New process id, or nullopt with error set
     */
    std::optional<std::string> start(const StartRequest &request, std::string &error);

    /**
     * @brief Request cancellation
     *
     * With an id: cancel that process (unknown/finished ids are a no-op).
     * Without: cancel every registered process.
     *
     * @return Number of processes whose flag was set
     */
    size_t stop(const std::optional<std::string> &process_id = std::nullopt);

    std::vector<ProcessInfo> list() const { return registry_.snapshot(); }
    bool is_registered(const std::string &process_id) const { return registry_.contains(process_id); }
    size_t running_count() const { return registry_.size(); }

    /**
     * @brief Block until no worker thread is alive
     *
     * @return false if timeout_ms elapsed first (timeout_ms < 0 waits forever)
     */
    bool wait_idle(int timeout_ms = -1);

    // Refuse new starts, cancel all, join all workers. Idempotent.
    void shutdown();

    const SupervisorConfig &config() const { return config_; }

private:
    struct Worker {
        std::thread thread;
        bool done = false;
    };

    void run_process(const ProcessInfo &info, const std::string &message,
                     std::shared_ptr<provider::IProviderDescriptor> descriptor,
                     std::shared_ptr<CancellationToken> token);

    // Registry removal then publish, in that order
    void finish_with_exit(const ProcessInfo &info, const std::string &event_prefix, int code);
    void finish_with_error(const ProcessInfo &info, const std::string &event_prefix, const std::string &error);

    void mark_worker_done(const std::string &process_id);
    void reap_finished_workers();

    const provider::ProviderCatalog &catalog_;
    events::IEventSink &sink_;
    const SupervisorConfig config_;

    ProcessRegistry registry_;

    mutable std::mutex workers_mutex_;
    std::condition_variable workers_cv_;
    std::unordered_map<std::string, Worker> workers_;
    bool shutting_down_ = false;
};

}  // namespace process
}  // namespace trellico
