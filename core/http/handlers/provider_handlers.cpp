#include "provider/provider_catalog.hpp"
#include "provider/provider_probe.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace trellico {
namespace http {

//=============================================================================
// GET /v0/providers
//=============================================================================
void HttpServer::handle_get_providers(const httplib::Request &, httplib::Response &res) {
    nlohmann::json providers = nlohmann::json::array();
    for (const auto &descriptor : catalog_.all()) {
        providers.push_back(encode_provider(*descriptor));
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"providers", providers}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/providers/{id}/status
//=============================================================================
void HttpServer::handle_get_provider_status(const httplib::Request &req, httplib::Response &res) {
    std::string provider_id;
    if (!parse_path_param(req, provider_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path");
        return;
    }

    auto descriptor = catalog_.get(provider_id);
    if (!descriptor) {
        send_error(res, StatusCode::NOT_FOUND, "Provider not found: " + provider_id);
        return;
    }

    // Runs `<binary> --version`; bounded by the probe timeout
    provider::ProviderStatus status = provider::check_availability(*descriptor);

    nlohmann::json response = encode_provider_status(status);
    response["status"] = make_status(StatusCode::OK);
    response["provider"] = provider_id;
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace trellico
