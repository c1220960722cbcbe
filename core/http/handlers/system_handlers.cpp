#include <chrono>
#include <exception>

#include "events/event_emitter.hpp"
#include "logging/logger.hpp"
#include "process/process_supervisor.hpp"
#include "provider/provider_catalog.hpp"
#include "watch/folder_watch_registry.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace trellico {
namespace http {

namespace {
constexpr int kSsePopTimeoutMs = 1000;
constexpr int kKeepaliveEveryPops = 15;
}  // namespace

//=============================================================================
// GET /v0/runtime/status
//=============================================================================
void HttpServer::handle_get_runtime_status(const httplib::Request &, httplib::Response &res) {
    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"uptime_seconds", uptime},
                               {"process_count", supervisor_.running_count()},
                               {"provider_count", catalog_.size()},
                               {"watched_folder_count", watches_.watched_folders().size()},
                               {"sse_clients", sse_client_count_.load()}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/events (SSE)
//=============================================================================
void HttpServer::handle_get_events(const httplib::Request &req, httplib::Response &res) {
    if (!event_emitter_) {
        send_error(res, StatusCode::UNAVAILABLE, "Event streaming not enabled");
        return;
    }

    if (event_emitter_->at_capacity()) {
        LOG_WARN("[SSE] Client rejected: max clients (" << event_emitter_->max_subscribers() << ") reached");
        send_error(res, StatusCode::UNAVAILABLE, "Too many SSE clients");
        return;
    }

    // Optional filters
    events::EventFilter filter;
    if (req.has_param("process_id")) {
        filter.process_id = req.get_param_value("process_id");
    }
    if (req.has_param("folder_path")) {
        filter.folder_path = req.get_param_value("folder_path");
    }
    if (req.has_param("name")) {
        filter.name = req.get_param_value("name");
    }

    std::string client_name = "sse-" + std::to_string(sse_client_count_.load() + 1);
    std::shared_ptr<events::Subscription> subscription(
        event_emitter_->subscribe(filter, sse_queue_size_, client_name).release());

    if (!subscription) {
        LOG_ERROR("[SSE] Failed to create subscription");
        send_error(res, StatusCode::UNAVAILABLE, "Failed to subscribe to events");
        return;
    }

    sse_client_count_++;
    LOG_INFO("[SSE] Client connected: " << client_name);

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");

    auto keepalive_counter = std::make_shared<int>(0);

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, subscription, client_name, keepalive_counter](size_t, httplib::DataSink &sink) {
            if (!running_.load()) {
                return false;
            }

            auto event_opt = subscription->pop(kSsePopTimeoutMs);

            if (event_opt) {
                // Not covered by the server exception handler
                std::string sse_data;
                try {
                    sse_data = format_sse_event(*event_opt);
                } catch (const std::exception &e) {
                    LOG_ERROR("[SSE] Dropping " << events::event_name(*event_opt) << " event for " << client_name
                                                << ": " << e.what());
                    return true;
                }
                if (!sink.write(sse_data.c_str(), sse_data.size())) {
                    LOG_WARN("[SSE] Write failed for " << client_name);
                    return false;
                }
                *keepalive_counter = 0;
            } else if (++(*keepalive_counter) >= kKeepaliveEveryPops) {
                std::string keepalive = ": keepalive\n\n";
                if (!sink.write(keepalive.c_str(), keepalive.size())) {
                    LOG_WARN("[SSE] Keep-alive failed for " << client_name);
                    return false;
                }
                *keepalive_counter = 0;
            }

            return true;
        },
        [this, client_name](bool) {
            sse_client_count_--;
            LOG_INFO("[SSE] Client disconnected: " << client_name);
        });
}

}  // namespace http
}  // namespace trellico
