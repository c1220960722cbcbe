#pragma once

#include <set>
#include <string>

namespace trellico {
namespace watch {

// Watched artifact kinds, one native watcher each per folder
enum class WatchKind {
    PLANS,            // "<state>/<plans>/*.md", classified plan-change events
    RALPH_PRDS,       // "<state>/<prd>/<name>/prd.json" entries, refresh signal only
    RALPH_ITERATIONS  // "<state>/ralph-iterations.json", refresh signal only
};

// "plans", "ralph-prds", "ralph-iterations"
bool parse_watch_kind(const std::string &value, WatchKind &out);
const char *watch_kind_to_string(WatchKind kind);

enum class RawEventKind { CREATE, MODIFY, REMOVE };

const char *raw_event_kind_to_string(RawEventKind kind);

// One low-level notification. Only "that" something changed is trusted, plus
// the path for modify detection.
struct RawEvent {
    RawEventKind kind = RawEventKind::MODIFY;
    std::string path;
    // Set when this event is the target side of a rename whose source was seen
    std::string moved_from;
};

// File stems (plans) or entry directory names (PRDs)
using StemSet = std::set<std::string>;

/**
 * @brief Per-folder on-disk layout of the watched artifacts
 *
 * Folder paths are joined verbatim, never canonicalized.
 */
struct WatchLayout {
    std::string state_dir = ".trellico";
    std::string plans_dir = "plans";
    std::string plan_extension = ".md";
    std::string prd_dir = "ralph";
    std::string prd_manifest = "prd.json";
    std::string iterations_file = "ralph-iterations.json";

    std::string state_path(const std::string &folder) const;
    std::string plans_path(const std::string &folder) const;
    std::string prd_path(const std::string &folder) const;
    std::string iterations_path(const std::string &folder) const;

    // Directory the native watcher for kind is installed on
    std::string watch_root(const std::string &folder, WatchKind kind) const;
};

}  // namespace watch
}  // namespace trellico
