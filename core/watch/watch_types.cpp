#include "watch_types.hpp"

#include <filesystem>

namespace trellico {
namespace watch {

namespace fs = std::filesystem;

bool parse_watch_kind(const std::string &value, WatchKind &out) {
    if (value == "plans") {
        out = WatchKind::PLANS;
        return true;
    }
    if (value == "ralph-prds") {
        out = WatchKind::RALPH_PRDS;
        return true;
    }
    if (value == "ralph-iterations") {
        out = WatchKind::RALPH_ITERATIONS;
        return true;
    }
    return false;
}

const char *watch_kind_to_string(WatchKind kind) {
    switch (kind) {
        case WatchKind::PLANS:
            return "plans";
        case WatchKind::RALPH_PRDS:
            return "ralph-prds";
        case WatchKind::RALPH_ITERATIONS:
            return "ralph-iterations";
        default:
            return "plans";
    }
}

const char *raw_event_kind_to_string(RawEventKind kind) {
    switch (kind) {
        case RawEventKind::CREATE:
            return "create";
        case RawEventKind::MODIFY:
            return "modify";
        case RawEventKind::REMOVE:
            return "remove";
        default:
            return "modify";
    }
}

std::string WatchLayout::state_path(const std::string &folder) const { return (fs::path(folder) / state_dir).string(); }

std::string WatchLayout::plans_path(const std::string &folder) const {
    return (fs::path(folder) / state_dir / plans_dir).string();
}

std::string WatchLayout::prd_path(const std::string &folder) const {
    return (fs::path(folder) / state_dir / prd_dir).string();
}

std::string WatchLayout::iterations_path(const std::string &folder) const {
    return (fs::path(folder) / state_dir / iterations_file).string();
}

std::string WatchLayout::watch_root(const std::string &folder, WatchKind kind) const {
    switch (kind) {
        case WatchKind::PLANS:
            return plans_path(folder);
        case WatchKind::RALPH_PRDS:
            return prd_path(folder);
        case WatchKind::RALPH_ITERATIONS:
        default:
            return state_path(folder);
    }
}

}  // namespace watch
}  // namespace trellico
