#include "folder_watch_registry.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"
#include "snapshot.hpp"

namespace trellico {
namespace watch {

namespace fs = std::filesystem;

FolderWatchRegistry::FolderWatchRegistry(events::IEventSink &sink, WatchLayout layout, WatcherFactory factory,
                                         std::shared_ptr<const IRenamePolicy> rename_policy)
    : sink_(sink),
      layout_(std::move(layout)),
      factory_(std::move(factory)),
      rename_policy_(std::move(rename_policy)) {
    if (!factory_) {
        factory_ = default_watcher_factory();
    }
    if (!rename_policy_) {
        rename_policy_ = std::make_shared<CountingRenamePolicy>();
    }
}

FolderWatchRegistry::~FolderWatchRegistry() { stop_all(); }

bool FolderWatchRegistry::scan(const std::string &folder, WatchKind kind, StemSet &out, std::string &error) const {
    switch (kind) {
        case WatchKind::PLANS:
            return scan_plan_stems(layout_.plans_path(folder), layout_.plan_extension, out, error);
        case WatchKind::RALPH_PRDS:
            return scan_prd_entries(layout_.prd_path(folder), layout_.prd_manifest, out, error);
        case WatchKind::RALPH_ITERATIONS:
        default:
            out.clear();
            return true;
    }
}

bool FolderWatchRegistry::watch(const std::string &folder, WatchKind kind, std::string &error) {
    if (folder.empty()) {
        error = "folder_path must not be empty";
        return false;
    }

    const std::string root = layout_.watch_root(folder, kind);

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        error = "Failed to create " + root + ": " + ec.message();
        return false;
    }

    // Seed before the watcher exists so pre-existing files never look new
    StemSet initial;
    if (!scan(folder, kind, initial, error)) {
        return false;
    }

    const uint64_t generation = next_generation_++;

    WatchOptions options;
    options.path = root;
    options.recursive = kind != WatchKind::RALPH_ITERATIONS;

    auto watcher = factory_(options, [this, folder, kind, generation](const RawEvent &event) {
        on_raw_event(folder, kind, generation, event);
    });
    if (!watcher) {
        error = "Failed to create watcher for " + root;
        return false;
    }

    // Publish the new state first so events arriving right after start() are not dropped
    std::unique_ptr<INativeWatcher> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        KindState &state = entries_[folder].kinds[kind];
        replaced = std::move(state.watcher);
        state.known = initial;
        state.generation = generation;
    }
    if (replaced) {
        LOG_INFO("[Watch] Replacing " << watch_kind_to_string(kind) << " watcher for " << folder);
        replaced.reset();
    }

    if (!watcher->start(error)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (find_live_locked(folder, kind, generation) != nullptr) {
                auto entry = entries_.find(folder);
                entry->second.kinds.erase(kind);
                if (entry->second.kinds.empty()) {
                    entries_.erase(entry);
                }
            }
        }
        LOG_WARN("[Watch] Failed to watch " << root << ": " << error);
        return false;
    }

    bool superseded = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        KindState *state = find_live_locked(folder, kind, generation);
        if (state != nullptr) {
            state->watcher = std::move(watcher);
        } else {
            superseded = true;
        }
    }
    if (superseded) {
        // stop_watching() or another watch() ran while we were starting
        LOG_DEBUG("[Watch] " << watch_kind_to_string(kind) << " watch for " << folder << " superseded during start");
        watcher.reset();
        return true;
    }

    LOG_INFO("[Watch] Watching " << watch_kind_to_string(kind) << " in " << folder << " (" << initial.size()
                                 << " known)");
    return true;
}

bool FolderWatchRegistry::stop_watching(const std::string &folder) {
    FolderEntry removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(folder);
        if (it == entries_.end()) {
            return false;
        }
        removed = std::move(it->second);
        entries_.erase(it);
    }

    // Joins watcher threads; in-flight callbacks find the entry gone and return
    removed.kinds.clear();

    LOG_INFO("[Watch] Stopped watching " << folder);
    return true;
}

void FolderWatchRegistry::stop_all() {
    std::unordered_map<std::string, FolderEntry> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed.swap(entries_);
    }
    if (!removed.empty()) {
        LOG_INFO("[Watch] Stopping " << removed.size() << " folder watch(es)");
    }
    removed.clear();
}

bool FolderWatchRegistry::is_watching(const std::string &folder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(folder) != entries_.end();
}

bool FolderWatchRegistry::is_watching(const std::string &folder, WatchKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(folder);
    return it != entries_.end() && it->second.kinds.count(kind) > 0;
}

std::optional<StemSet> FolderWatchRegistry::known_set(const std::string &folder, WatchKind kind) const {
    if (kind == WatchKind::RALPH_ITERATIONS) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(folder);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    auto kind_it = it->second.kinds.find(kind);
    if (kind_it == it->second.kinds.end()) {
        return std::nullopt;
    }
    return kind_it->second.known;
}

std::vector<std::string> FolderWatchRegistry::watched_folders() const {
    std::vector<std::string> folders;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        folders.reserve(entries_.size());
        for (const auto &[folder, entry] : entries_) {
            static_cast<void>(entry);
            folders.push_back(folder);
        }
    }
    std::sort(folders.begin(), folders.end());
    return folders;
}

std::vector<WatchKind> FolderWatchRegistry::watched_kinds(const std::string &folder) const {
    std::vector<WatchKind> kinds;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(folder);
    if (it != entries_.end()) {
        for (const auto &[kind, state] : it->second.kinds) {
            static_cast<void>(state);
            kinds.push_back(kind);
        }
    }
    return kinds;
}

FolderWatchRegistry::KindState *FolderWatchRegistry::find_live_locked(const std::string &folder, WatchKind kind,
                                                                      uint64_t generation) {
    auto it = entries_.find(folder);
    if (it == entries_.end()) {
        return nullptr;
    }
    auto kind_it = it->second.kinds.find(kind);
    if (kind_it == it->second.kinds.end() || kind_it->second.generation != generation) {
        return nullptr;
    }
    return &kind_it->second;
}

void FolderWatchRegistry::on_raw_event(const std::string &folder, WatchKind kind, uint64_t generation,
                                       const RawEvent &event) {
    try {
        if (kind == WatchKind::RALPH_ITERATIONS) {
            if (fs::path(event.path).lexically_normal() !=
                fs::path(layout_.iterations_path(folder)).lexically_normal()) {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (find_live_locked(folder, kind, generation) == nullptr) {
                    return;
                }
            }
            publish_refresh(folder, events::RefreshSignal::RALPH_ITERATIONS_CHANGED);
            return;
        }

        StemSet current;
        std::string error;
        if (!scan(folder, kind, current, error)) {
            LOG_DEBUG("[Watch] Rescan failed for " << folder << ": " << error);
            return;
        }

        std::vector<FileChange> changes;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            KindState *state = find_live_locked(folder, kind, generation);
            if (state == nullptr) {
                return;
            }
            if (kind == WatchKind::PLANS) {
                ChangeClassifier classifier(layout_.plans_path(folder), layout_.plan_extension, rename_policy_);
                changes = classifier.classify(event, state->known, current);
            }
            state->known = std::move(current);
        }

        if (kind == WatchKind::RALPH_PRDS) {
            publish_refresh(folder, events::RefreshSignal::RALPH_PRD_CHANGED);
            return;
        }

        for (auto &change : changes) {
            LOG_DEBUG("[Watch] " << folder << ": " << events::change_type_to_string(change.type) << " "
                                 << change.file_name);
            events::PlanChangeEvent plan_event;
            plan_event.change_type = change.type;
            plan_event.file_name = std::move(change.file_name);
            plan_event.old_file_name = std::move(change.old_file_name);
            plan_event.folder_path = folder;
            plan_event.timestamp_ms = events::now_ms();
            sink_.publish(std::move(plan_event));
        }
        publish_refresh(folder, events::RefreshSignal::PLANS_CHANGED);
    } catch (const std::exception &e) {
        LOG_ERROR("[Watch] Event handling failed for " << folder << ": " << e.what());
    }
}

void FolderWatchRegistry::publish_refresh(const std::string &folder, events::RefreshSignal signal) {
    events::FolderChangedEvent event;
    event.signal = signal;
    event.folder_path = folder;
    event.timestamp_ms = events::now_ms();
    sink_.publish(std::move(event));
}

}  // namespace watch
}  // namespace trellico
