#include "json.hpp"

namespace trellico {
namespace http {

namespace {

// Reads an optional string field; a present non-string value is an error
bool read_string_field(const nlohmann::json &json, const char *field, std::optional<std::string> &out,
                       std::string &error) {
    out.reset();
    auto it = json.find(field);
    if (it == json.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        error = std::string("Field '") + field + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_required_string(const nlohmann::json &json, const char *field, std::string &out, std::string &error) {
    std::optional<std::string> value;
    if (!read_string_field(json, field, value, error)) {
        return false;
    }
    if (!value || value->empty()) {
        error = std::string("Missing required field '") + field + "'";
        return false;
    }
    out = *value;
    return true;
}

}  // namespace

nlohmann::json encode_process_info(const process::ProcessInfo &info) {
    nlohmann::json result = {{"process_id", info.process_id},
                             {"provider", info.provider_id},
                             {"folder_path", info.folder_path},
                             {"started_at_ms", info.started_at_ms}};
    result["session_id"] = info.resume_session ? nlohmann::json(*info.resume_session) : nlohmann::json();
    return result;
}

nlohmann::json encode_provider(const provider::IProviderDescriptor &descriptor) {
    auto binary = descriptor.find_binary();
    nlohmann::json result = {{"id", descriptor.id()},
                             {"display_name", descriptor.display_name()},
                             {"event_prefix", descriptor.event_prefix()}};
    result["binary_path"] = binary ? nlohmann::json(*binary) : nlohmann::json();
    return result;
}

nlohmann::json encode_provider_status(const provider::ProviderStatus &status) {
    nlohmann::json result = {{"available", status.available}};
    result["error"] = status.error.empty() ? nlohmann::json() : nlohmann::json(status.error);
    result["error_type"] = status.error_type == provider::AvailabilityError::NONE
                               ? nlohmann::json()
                               : nlohmann::json(provider::availability_error_to_string(status.error_type));
    result["auth_instructions"] =
        status.auth_instructions.empty() ? nlohmann::json() : nlohmann::json(status.auth_instructions);
    return result;
}

bool decode_start_request(const nlohmann::json &json, process::StartRequest &request, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }
    if (!read_required_string(json, "provider", request.provider_id, error) ||
        !read_required_string(json, "message", request.message, error) ||
        !read_required_string(json, "folder_path", request.folder_path, error)) {
        return false;
    }
    // Opaque; forwarded as-is
    return read_string_field(json, "session_id", request.resume_session, error);
}

bool decode_stop_request(const nlohmann::json &json, std::optional<std::string> &process_id, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }
    return read_string_field(json, "process_id", process_id, error);
}

bool decode_watch_request(const nlohmann::json &json, std::string &folder_path, watch::WatchKind &kind,
                          std::string &error) {
    if (!decode_folder_request(json, folder_path, error)) {
        return false;
    }

    std::string kind_str;
    if (!read_required_string(json, "kind", kind_str, error)) {
        return false;
    }
    if (!watch::parse_watch_kind(kind_str, kind)) {
        error = "Invalid kind '" + kind_str + "': must be plans, ralph-prds or ralph-iterations";
        return false;
    }
    return true;
}

bool decode_folder_request(const nlohmann::json &json, std::string &folder_path, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }
    return read_required_string(json, "folder_path", folder_path, error);
}

std::string dump_json(const nlohmann::json &json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string format_sse_event(const events::Event &event) {
    std::string result = "event: " + events::event_name(event) + "\n";
    result += "id: " + std::to_string(events::get_event_id(event)) + "\n";
    result += "data: " + dump_json(events::event_payload(event)) + "\n\n";
    return result;
}

}  // namespace http
}  // namespace trellico
