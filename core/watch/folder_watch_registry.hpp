#pragma once

/**
 * @file folder_watch_registry.hpp
 * @brief Per-folder native watchers plus the known sets they diff against
 *
 * One entry per folder path string (not canonicalized), holding up to one
 * native watcher per WatchKind. Entries are created by watch() and destroyed
 * only by stop_watching() / stop_all().
 *
 * Callback flow for one raw event:
 * 1. Rescan the watched directory outside the lock
 * 2. Under the lock: drop the event if the watch was stopped or replaced,
 *    classify against the stored known set, store the fresh scan
 * 3. Publish outside the lock: classified plan changes, then the refresh signal
 *
 * Callbacks of a single native watcher are serialized by that watcher, and
 * known-set updates are linearized by the registry lock.
 */

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "change_classifier.hpp"
#include "events/event_sink.hpp"
#include "native_watcher.hpp"
#include "watch_types.hpp"

namespace trellico {
namespace watch {

class FolderWatchRegistry {
public:
    FolderWatchRegistry(events::IEventSink &sink, WatchLayout layout = WatchLayout{},
                        WatcherFactory factory = default_watcher_factory(),
                        std::shared_ptr<const IRenamePolicy> rename_policy = nullptr);

    // Stops every watcher
    ~FolderWatchRegistry();

    FolderWatchRegistry(const FolderWatchRegistry &) = delete;
    FolderWatchRegistry &operator=(const FolderWatchRegistry &) = delete;

    /**
     * @brief Start (or restart) watching one artifact kind of a folder
     *
     * Creates the watched directory if needed, seeds the known set, then
     * installs the native watcher. Re-watching a kind replaces its watcher and
     * known set.
     *
     * @return false (and sets error) if the directory cannot be created,
     *         scanned or watched
     */
    bool watch(const std::string &folder, WatchKind kind, std::string &error);

    /**
     * @brief Drop every watcher of a folder
     *
     * When this returns no further events are published for the folder.
     *
     * @return true if the folder was being watched
     */
    bool stop_watching(const std::string &folder);

    void stop_all();

    bool is_watching(const std::string &folder) const;
    bool is_watching(const std::string &folder, WatchKind kind) const;

    // Last stored known set, nullopt if not watched (or kind keeps none)
    std::optional<StemSet> known_set(const std::string &folder, WatchKind kind) const;

    // Sorted
    std::vector<std::string> watched_folders() const;
    std::vector<WatchKind> watched_kinds(const std::string &folder) const;

    const WatchLayout &layout() const { return layout_; }

private:
    struct KindState {
        std::unique_ptr<INativeWatcher> watcher;
        StemSet known;
        uint64_t generation = 0;
    };

    struct FolderEntry {
        std::map<WatchKind, KindState> kinds;
    };

    bool scan(const std::string &folder, WatchKind kind, StemSet &out, std::string &error) const;

    void on_raw_event(const std::string &folder, WatchKind kind, uint64_t generation, const RawEvent &event);

    // True if (folder, kind) is still watched by this generation. Requires mutex_.
    KindState *find_live_locked(const std::string &folder, WatchKind kind, uint64_t generation);

    void publish_refresh(const std::string &folder, events::RefreshSignal signal);

    events::IEventSink &sink_;
    const WatchLayout layout_;
    WatcherFactory factory_;
    std::shared_ptr<const IRenamePolicy> rename_policy_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, FolderEntry> entries_;
    std::atomic<uint64_t> next_generation_{1};
};

}  // namespace watch
}  // namespace trellico
