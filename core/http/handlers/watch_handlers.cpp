#include "logging/logger.hpp"
#include "watch/folder_watch_registry.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace trellico {
namespace http {

//=============================================================================
// POST /v0/watches
//=============================================================================
void HttpServer::handle_post_watch(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    std::string error;
    if (!parse_json_body(req, body, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    std::string folder_path;
    watch::WatchKind kind;
    if (!decode_watch_request(body, folder_path, kind, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    if (!watches_.watch(folder_path, kind, error)) {
        LOG_WARN("[HTTP] Watch failed for " << folder_path << ": " << error);
        send_error(res, StatusCode::INTERNAL, error);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"folder_path", folder_path},
                               {"kind", watch::watch_kind_to_string(kind)}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/watches/stop
//=============================================================================
void HttpServer::handle_post_watch_stop(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    std::string error;
    if (!parse_json_body(req, body, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    std::string folder_path;
    if (!decode_folder_request(body, folder_path, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    bool stopped = watches_.stop_watching(folder_path);

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"stopped", stopped}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/watches
//=============================================================================
void HttpServer::handle_get_watches(const httplib::Request &, httplib::Response &res) {
    nlohmann::json folders = nlohmann::json::array();
    for (const auto &folder : watches_.watched_folders()) {
        nlohmann::json kinds = nlohmann::json::array();
        for (auto kind : watches_.watched_kinds(folder)) {
            kinds.push_back(watch::watch_kind_to_string(kind));
        }
        folders.push_back({{"folder_path", folder}, {"kinds", kinds}});
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"watches", folders}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace trellico
