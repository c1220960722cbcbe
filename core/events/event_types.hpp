#pragma once

/**
 * @file event_types.hpp
 * @brief Events published by the orchestration core to the UI event sink
 *
 * Two families of events leave the core:
 * - Process events (output chunk, exit, error) tagged with a process identity
 *   and named after the provider's event prefix ("claude-output", ...)
 * - Folder events (classified plan changes and plain refresh signals) tagged
 *   with the originating folder path
 *
 * Events are immutable value types. The observable name and JSON payload of
 * each event are produced by event_name() / event_payload(); those names and
 * field names are part of the contract with the presentation layer.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace trellico {
namespace events {

/**
 * @brief Semantic change type produced by the change classifier
 */
enum class ChangeType { CREATED, MODIFIED, REMOVED, RENAMED };

const char *change_type_to_string(ChangeType type);

/**
 * @brief Unconditional refresh signals, one per watched artifact kind
 */
enum class RefreshSignal { PLANS_CHANGED, RALPH_PRD_CHANGED, RALPH_ITERATIONS_CHANGED };

const char *refresh_signal_name(RefreshSignal signal);

/**
 * @brief One decoded chunk of terminal output, verbatim (not line-buffered)
 */
struct ProcessOutputEvent {
    uint64_t event_id = 0;
    std::string event_prefix;  // e.g. "claude"
    std::string process_id;
    std::string data;
    int64_t timestamp_ms = 0;
};

/**
 * @brief Terminal event: the child was reaped (includes cancellation-by-kill)
 */
struct ProcessExitEvent {
    uint64_t event_id = 0;
    std::string event_prefix;
    std::string process_id;
    int code = -1;
    int64_t timestamp_ms = 0;
};

/**
 * @brief Terminal event: spawn, streaming or wait failed
 */
struct ProcessErrorEvent {
    uint64_t event_id = 0;
    std::string event_prefix;
    std::string process_id;
    std::string error;
    int64_t timestamp_ms = 0;
};

/**
 * @brief Classified change to one plan file (stem, no extension)
 */
struct PlanChangeEvent {
    uint64_t event_id = 0;
    ChangeType change_type = ChangeType::MODIFIED;
    std::string file_name;
    std::optional<std::string> old_file_name;  // set for RENAMED only
    std::string folder_path;
    int64_t timestamp_ms = 0;
};

/**
 * @brief Generic "something changed" signal for a watched folder
 */
struct FolderChangedEvent {
    uint64_t event_id = 0;
    RefreshSignal signal = RefreshSignal::PLANS_CHANGED;
    std::string folder_path;
    int64_t timestamp_ms = 0;
};

using Event =
    std::variant<ProcessOutputEvent, ProcessExitEvent, ProcessErrorEvent, PlanChangeEvent, FolderChangedEvent>;

// Current wall clock in epoch milliseconds
int64_t now_ms();

// Observable event name ("claude-output", "plan-change", "plans-changed", ...)
std::string event_name(const Event &event);

// JSON payload with the contract field names (process_id, data, code, ...)
nlohmann::json event_payload(const Event &event);

uint64_t get_event_id(const Event &event);

// Empty string for events that do not carry the field
std::string get_process_id(const Event &event);
std::string get_folder_path(const Event &event);

bool is_terminal_process_event(const Event &event);

}  // namespace events
}  // namespace trellico
