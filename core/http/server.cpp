#include "server.hpp"

#include <string>
#include <vector>

#include "errors.hpp"
#include "json.hpp"
#include "events/event_emitter.hpp"
#include "logging/logger.hpp"

namespace trellico {
namespace http {

namespace {
constexpr int kIoTimeoutSeconds = 5;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternal = 500;

constexpr const char *kAllowMethods = "GET, POST, OPTIONS";
constexpr const char *kAllowHeaders = "Content-Type";

// "*" matches everything; one '*' inside an entry matches any run of characters
bool origin_matches(const std::string &allowed, const std::string &origin) {
    if (allowed == "*") {
        return true;
    }
    const auto star = allowed.find('*');
    if (star == std::string::npos) {
        return allowed == origin;
    }
    const size_t suffix_len = allowed.size() - star - 1;
    if (origin.size() < star + suffix_len) {
        return false;
    }
    return origin.compare(0, star, allowed, 0, star) == 0 &&
           origin.compare(origin.size() - suffix_len, suffix_len, allowed, star + 1, suffix_len) == 0;
}

// Value for Access-Control-Allow-Origin, empty if the origin is not allowed
std::string allowed_origin(const std::vector<std::string> &allowlist, const std::string &origin) {
    for (const auto &allowed : allowlist) {
        if (origin_matches(allowed, origin)) {
            return allowed == "*" ? "*" : origin;
        }
    }
    return "";
}

// JSON body for errors raised by httplib itself (unknown route, bad request line)
void fill_library_error(const httplib::Request &req, httplib::Response &res) {
    StatusCode code = StatusCode::INTERNAL;
    std::string message = "Internal server error";
    switch (res.status) {
        case kStatusNotFound:
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
            break;
        case kStatusMethodNotAllowed:
            code = StatusCode::INVALID_ARGUMENT;
            message = "Method not allowed: " + req.method + " " + req.path;
            break;
        case kStatusBadRequest:
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
            break;
        default:
            break;
    }
    res.set_content(dump_json(make_error_response(code, message)), "application/json");
}
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, process::ProcessSupervisor &supervisor,
                       const provider::ProviderCatalog &catalog, watch::FolderWatchRegistry &watches,
                       std::shared_ptr<events::EventEmitter> event_emitter, size_t sse_queue_size)
    : config_(config),
      supervisor_(supervisor),
      catalog_(catalog),
      watches_(watches),
      event_emitter_(std::move(event_emitter)),
      sse_queue_size_(sse_queue_size),
      start_time_(std::chrono::steady_clock::now()) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(kIoTimeoutSeconds, 0);
    server_->set_write_timeout(kIoTimeoutSeconds, 0);

    // Each SSE client pins a pool thread for the lifetime of its stream
    const int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // CORS headers on every response whose Origin is allowlisted
    server_->set_post_routing_handler([allowlist = config_.cors_allowed_origins,
                                       credentials = config_.cors_allow_credentials](const httplib::Request &req,
                                                                                     httplib::Response &res) {
        if (!req.has_header("Origin")) {
            return;
        }
        const std::string value = allowed_origin(allowlist, req.get_header_value("Origin"));
        if (value.empty()) {
            return;
        }
        res.set_header("Access-Control-Allow-Origin", value);
        res.set_header("Access-Control-Allow-Methods", kAllowMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowHeaders);
        if (credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    setup_routes();

    // Handlers always set a JSON body; only library-generated errors land here empty
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (res.body.empty()) {
            fill_library_error(req, res);
        }
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string message = "Unknown exception";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            message = e.what();
        } catch (...) {
            // Non-std exception: reported with the generic message
        }
        LOG_ERROR("[HTTP] " << req.method << " " << req.path << " threw: " << message);
        res.status = kStatusInternal;
        res.set_content(dump_json(make_error_response(StatusCode::INTERNAL, message)), "application/json");
    });

    // Port 0 asks the OS for an ephemeral port
    port_ = config_.port == 0 ? server_->bind_to_any_port(config_.bind.c_str())
                              : (server_->bind_to_port(config_.bind.c_str(), config_.port) ? config_.port : -1);
    if (port_ < 0) {
        error = "Failed to bind to " + config_.bind + ":" + (config_.port == 0 ? "<any>" : std::to_string(config_.port));
        port_ = 0;
        server_.reset();
        return false;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_DEBUG("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_DEBUG("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // POST /v0/processes - Start a provider process
    server_->Post("/v0/processes",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_process(req, res); });

    // POST /v0/processes/stop - Cancel one process (or all / the only one)
    server_->Post("/v0/processes/stop",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_process_stop(req, res); });

    // GET /v0/processes - List registered processes
    server_->Get("/v0/processes",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_processes(req, res); });

    // GET /v0/providers - List configured providers
    server_->Get("/v0/providers",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_providers(req, res); });

    // GET /v0/providers/:id/status - Probe installation and login state
    server_->Get(R"(/v0/providers/([^/]+)/status)", [this](const httplib::Request &req, httplib::Response &res) {
        handle_get_provider_status(req, res);
    });

    // POST /v0/watches - Start watching a folder for one kind
    server_->Post("/v0/watches",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_watch(req, res); });

    // POST /v0/watches/stop - Stop every watch for a folder
    server_->Post("/v0/watches/stop",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_watch_stop(req, res); });

    // GET /v0/watches - List watched folders and kinds
    server_->Get("/v0/watches",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_watches(req, res); });

    // OPTIONS catch-all for CORS preflight on all routes
    server_->Options(R"(/v0/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowHeaders);
    });

    // GET /v0/runtime/status - Get runtime status
    server_->Get("/v0/runtime/status",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_runtime_status(req, res); });

    // GET /v0/events - SSE event stream
    server_->Get("/v0/events",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_events(req, res); });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("  POST /v0/processes");
    LOG_INFO("  POST /v0/processes/stop");
    LOG_INFO("  GET  /v0/processes");
    LOG_INFO("  GET  /v0/providers");
    LOG_INFO("  GET  /v0/providers/{id}/status");
    LOG_INFO("  POST /v0/watches");
    LOG_INFO("  POST /v0/watches/stop");
    LOG_INFO("  GET  /v0/watches");
    LOG_INFO("  GET  /v0/runtime/status");
    LOG_INFO("  GET  /v0/events (SSE)");
}

}  // namespace http
}  // namespace trellico
