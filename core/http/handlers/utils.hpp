#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>

#include "../errors.hpp"
#include "../json.hpp"

namespace trellico {
namespace http {

// Helper: first regex capture of the route (e.g. provider id)
inline bool parse_path_param(const httplib::Request &req, std::string &value) {
    if (req.matches.size() >= 2) {
        value = req.matches[1].str();
        return true;
    }
    return false;
}

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(dump_json(body), "application/json");
}

inline void send_error(httplib::Response &res, StatusCode code, const std::string &message) {
    send_json(res, code, make_error_response(code, message));
}

// Helper: parse a JSON object body. An empty body is treated as {}.
inline bool parse_json_body(const httplib::Request &req, nlohmann::json &out, std::string &error) {
    if (req.body.empty()) {
        out = nlohmann::json::object();
        return true;
    }
    try {
        out = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error &e) {
        error = std::string("Invalid JSON: ") + e.what();
        return false;
    }
    if (!out.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }
    return true;
}

}  // namespace http
}  // namespace trellico
