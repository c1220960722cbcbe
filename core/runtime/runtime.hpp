#pragma once

#include <atomic>
#include <memory>

#include "config.hpp"
#include "events/event_emitter.hpp"
#include "http/server.hpp"
#include "process/process_supervisor.hpp"
#include "provider/provider_catalog.hpp"
#include "watch/folder_watch_registry.hpp"

namespace trellico {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Initialize all components (catalog, supervisor, watches, HTTP)
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Cancels every process, stops every watch and the HTTP server
    void shutdown();

    events::EventEmitter &get_event_emitter() { return *event_emitter_; }
    provider::ProviderCatalog &get_catalog() { return *catalog_; }
    process::ProcessSupervisor &get_supervisor() { return *supervisor_; }
    watch::FolderWatchRegistry &get_watches() { return *watches_; }

private:
    bool init_core_services(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    std::shared_ptr<events::EventEmitter> event_emitter_;  // Shared with HTTP (SSE)
    std::unique_ptr<provider::ProviderCatalog> catalog_;
    std::unique_ptr<process::ProcessSupervisor> supervisor_;
    std::unique_ptr<watch::FolderWatchRegistry> watches_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

}  // namespace runtime
}  // namespace trellico
