#include "logging/logger.hpp"
#include "process/process_supervisor.hpp"
#include "provider/provider_catalog.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace trellico {
namespace http {

//=============================================================================
// POST /v0/processes
//=============================================================================
void HttpServer::handle_post_process(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    std::string error;
    if (!parse_json_body(req, body, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    process::StartRequest request;
    if (!decode_start_request(body, request, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    if (!catalog_.contains(request.provider_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Unknown provider: " + request.provider_id);
        return;
    }

    auto process_id = supervisor_.start(request, error);
    if (!process_id) {
        LOG_WARN("[HTTP] Process start rejected: " << error);
        send_error(res, StatusCode::FAILED_PRECONDITION, error);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"process_id", *process_id}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/processes/stop
//=============================================================================
void HttpServer::handle_post_process_stop(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    std::string error;
    if (!parse_json_body(req, body, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    std::optional<std::string> process_id;
    if (!decode_stop_request(body, process_id, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    // Unknown or already-finished ids are a no-op, not an error
    size_t cancelled = supervisor_.stop(process_id);

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"cancelled", cancelled}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/processes
//=============================================================================
void HttpServer::handle_get_processes(const httplib::Request &, httplib::Response &res) {
    nlohmann::json processes = nlohmann::json::array();
    for (const auto &info : supervisor_.list()) {
        processes.push_back(encode_process_info(info));
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"processes", processes}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace trellico
