#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "events/event_types.hpp"
#include "process/process_registry.hpp"
#include "process/process_supervisor.hpp"
#include "provider/provider_descriptor.hpp"
#include "provider/provider_probe.hpp"
#include "watch/watch_types.hpp"

namespace trellico {
namespace http {

/**
 * @brief JSON encoding utilities for the HTTP adapter
 *
 * Field names are snake_case and match the event payload names, so a client
 * can correlate process_id / folder_path across REST responses and SSE.
 */

// Serialize for the wire. Invalid UTF-8 (file names are raw bytes) becomes
// U+FFFD instead of throwing.
std::string dump_json(const nlohmann::json &json);

nlohmann::json encode_process_info(const process::ProcessInfo &info);
nlohmann::json encode_provider(const provider::IProviderDescriptor &descriptor);
nlohmann::json encode_provider_status(const provider::ProviderStatus &status);

// Decode functions for incoming requests
bool decode_start_request(const nlohmann::json &json, process::StartRequest &request, std::string &error);
bool decode_stop_request(const nlohmann::json &json, std::optional<std::string> &process_id, std::string &error);
bool decode_watch_request(const nlohmann::json &json, std::string &folder_path, watch::WatchKind &kind,
                          std::string &error);
bool decode_folder_request(const nlohmann::json &json, std::string &folder_path, std::string &error);

// "event: <name>\nid: <event_id>\ndata: <payload>\n\n"
std::string format_sse_event(const events::Event &event);

}  // namespace http
}  // namespace trellico
