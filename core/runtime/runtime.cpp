#include "runtime.hpp"

#include <chrono>
#include <cstring>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace trellico {
namespace runtime {

namespace {
constexpr int kMainLoopSleepMs = 100;
constexpr int kShutdownGraceMs = 5000;
}  // namespace

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing Trellico runtime");

    if (!init_core_services(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_core_services(std::string &error) {
    event_emitter_ = std::make_shared<events::EventEmitter>(static_cast<size_t>(config_.events.queue_size),
                                                             static_cast<size_t>(config_.events.max_subscribers));
    LOG_INFO("[Runtime] Event emitter created (max " << event_emitter_->max_subscribers() << " subscribers)");

    catalog_ = provider::ProviderCatalog::from_configs(config_.providers);
    if (!catalog_ || catalog_->size() == 0) {
        error = "No providers configured";
        return false;
    }
    for (const auto &id : catalog_->ids()) {
        auto descriptor = catalog_->get(id);
        auto binary = descriptor->find_binary();
        LOG_INFO("[Runtime] Provider '" << id << "' (" << descriptor->display_name() << "): "
                                        << (binary ? *binary : std::string("binary not found")));
    }

    process::SupervisorConfig supervisor_config = to_supervisor_config(config_.processes);
    supervisor_ = std::make_unique<process::ProcessSupervisor>(*catalog_, *event_emitter_, supervisor_config);
    LOG_INFO("[Runtime] Process supervisor ready (mode: " << process::process_mode_to_string(supervisor_config.mode)
                                                          << ", utf8: "
                                                          << process::utf8_policy_to_string(supervisor_config.utf8_policy)
                                                          << ")");

    watches_ = std::make_unique<watch::FolderWatchRegistry>(*event_emitter_, config_.watch);
    LOG_INFO("[Runtime] Folder watch registry ready (state dir: " << config_.watch.state_dir << ")");
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (!config_.http.enabled) {
        LOG_INFO("[Runtime] HTTP server disabled");
        return true;
    }

    http_server_ = std::make_unique<http::HttpServer>(config_.http, *supervisor_, *catalog_, *watches_,
                                                      event_emitter_, static_cast<size_t>(config_.events.queue_size));

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }

    LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << http_server_->get_port());
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(kMainLoopSleepMs));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] " << strsignal(SignalHandler::received_signal()) << " received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
    shutdown();
}

void Runtime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    // Stop accepting requests first so no new process or watch can slip in
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (supervisor_) {
        size_t running = supervisor_->stop();
        if (running > 0) {
            LOG_INFO("[Runtime] Cancelling " << running << " running process(es)");
        }
        if (!supervisor_->wait_idle(kShutdownGraceMs)) {
            LOG_WARN("[Runtime] Processes still running after " << kShutdownGraceMs << "ms");
        }
        supervisor_->shutdown();
    }

    if (watches_) {
        LOG_INFO("[Runtime] Stopping folder watches");
        watches_->stop_all();
    }
}

}  // namespace runtime
}  // namespace trellico
