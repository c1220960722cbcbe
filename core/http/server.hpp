#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "runtime/config.hpp"

// Forward declarations
namespace trellico {
namespace events {
class EventEmitter;
}
namespace process {
class ProcessSupervisor;
}
namespace provider {
class ProviderCatalog;
}
namespace watch {
class FolderWatchRegistry;
}
}  // namespace trellico

namespace trellico {
namespace http {

/**
 * @brief HTTP server wrapper for the Trellico runtime
 *
 * The HTTP server is an external adapter layer that exposes process
 * orchestration and folder watching over REST endpoints, and streams every
 * published event over SSE. It delegates all operations to the core
 * components (ProcessSupervisor, ProviderCatalog, FolderWatchRegistry).
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - All core operations are thread-safe
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    /**
     * @param config HTTP configuration (bind address, port, CORS, pool size)
     * @param supervisor Process supervisor for start/stop/list
     * @param catalog Provider catalog for listing and availability probes
     * @param watches Folder watch registry
     * @param event_emitter Event emitter for SSE streaming
     * @param sse_queue_size Per-SSE-client queue depth
     */
    HttpServer(const runtime::HttpConfig &config, process::ProcessSupervisor &supervisor,
               const provider::ProviderCatalog &catalog, watch::FolderWatchRegistry &watches,
               std::shared_ptr<events::EventEmitter> event_emitter, size_t sse_queue_size = 256);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Signals shutdown and waits for server thread to exit.
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    process::ProcessSupervisor &supervisor_;
    const provider::ProviderCatalog &catalog_;
    watch::FolderWatchRegistry &watches_;
    std::shared_ptr<events::EventEmitter> event_emitter_;
    size_t sse_queue_size_;

    // SSE client tracking
    std::atomic<int> sse_client_count_{0};

    std::chrono::steady_clock::time_point start_time_;

    // Server state
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Process handlers (handlers/process_handlers.cpp)
    void handle_post_process(const httplib::Request &req, httplib::Response &res);
    void handle_post_process_stop(const httplib::Request &req, httplib::Response &res);
    void handle_get_processes(const httplib::Request &req, httplib::Response &res);

    // Provider handlers (handlers/provider_handlers.cpp)
    void handle_get_providers(const httplib::Request &req, httplib::Response &res);
    void handle_get_provider_status(const httplib::Request &req, httplib::Response &res);

    // Watch handlers (handlers/watch_handlers.cpp)
    void handle_post_watch(const httplib::Request &req, httplib::Response &res);
    void handle_post_watch_stop(const httplib::Request &req, httplib::Response &res);
    void handle_get_watches(const httplib::Request &req, httplib::Response &res);

    // System handlers (handlers/system_handlers.cpp)
    void handle_get_runtime_status(const httplib::Request &req, httplib::Response &res);
    void handle_get_events(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace trellico
