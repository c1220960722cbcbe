#include "event_types.hpp"

#include <chrono>
#include <type_traits>

namespace trellico {
namespace events {

const char *change_type_to_string(ChangeType type) {
    switch (type) {
        case ChangeType::CREATED:
            return "created";
        case ChangeType::MODIFIED:
            return "modified";
        case ChangeType::REMOVED:
            return "removed";
        case ChangeType::RENAMED:
            return "renamed";
        default:
            return "modified";
    }
}

const char *refresh_signal_name(RefreshSignal signal) {
    switch (signal) {
        case RefreshSignal::PLANS_CHANGED:
            return "plans-changed";
        case RefreshSignal::RALPH_PRD_CHANGED:
            return "ralph-prd-changed";
        case RefreshSignal::RALPH_ITERATIONS_CHANGED:
            return "ralph-iterations-changed";
        default:
            return "plans-changed";
    }
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string event_name(const Event &event) {
    return std::visit(
        [](auto &&e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ProcessOutputEvent>) {
                return e.event_prefix + "-output";
            } else if constexpr (std::is_same_v<T, ProcessExitEvent>) {
                return e.event_prefix + "-exit";
            } else if constexpr (std::is_same_v<T, ProcessErrorEvent>) {
                return e.event_prefix + "-error";
            } else if constexpr (std::is_same_v<T, PlanChangeEvent>) {
                return "plan-change";
            } else {
                return refresh_signal_name(e.signal);
            }
        },
        event);
}

nlohmann::json event_payload(const Event &event) {
    return std::visit(
        [](auto &&e) -> nlohmann::json {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ProcessOutputEvent>) {
                return {{"process_id", e.process_id}, {"data", e.data}};
            } else if constexpr (std::is_same_v<T, ProcessExitEvent>) {
                return {{"process_id", e.process_id}, {"code", e.code}};
            } else if constexpr (std::is_same_v<T, ProcessErrorEvent>) {
                return {{"process_id", e.process_id}, {"error", e.error}};
            } else if constexpr (std::is_same_v<T, PlanChangeEvent>) {
                nlohmann::json payload = {{"change_type", change_type_to_string(e.change_type)},
                                          {"file_name", e.file_name},
                                          {"folder_path", e.folder_path}};
                // Always present so consumers can rely on the key; null unless renamed
                payload["old_file_name"] = e.old_file_name ? nlohmann::json(*e.old_file_name) : nlohmann::json();
                return payload;
            } else {
                return {{"folder_path", e.folder_path}};
            }
        },
        event);
}

uint64_t get_event_id(const Event &event) {
    return std::visit([](auto &&e) { return e.event_id; }, event);
}

std::string get_process_id(const Event &event) {
    return std::visit(
        [](auto &&e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ProcessOutputEvent> || std::is_same_v<T, ProcessExitEvent> ||
                          std::is_same_v<T, ProcessErrorEvent>) {
                return e.process_id;
            } else {
                return std::string();
            }
        },
        event);
}

std::string get_folder_path(const Event &event) {
    return std::visit(
        [](auto &&e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, PlanChangeEvent> || std::is_same_v<T, FolderChangedEvent>) {
                return e.folder_path;
            } else {
                return std::string();
            }
        },
        event);
}

bool is_terminal_process_event(const Event &event) {
    return std::holds_alternative<ProcessExitEvent>(event) || std::holds_alternative<ProcessErrorEvent>(event);
}

}  // namespace events
}  // namespace trellico
