#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "native_watcher.hpp"

namespace trellico {
namespace watch {

// InotifyWatcher watches a directory (optionally its whole subtree) with inotify.
// Mapping to raw events:
// - IN_CREATE                         -> CREATE
// - IN_MOVED_TO                       -> MODIFY (moved_from set when paired by cookie)
// - IN_CLOSE_WRITE                    -> MODIFY (one per completed write)
// - IN_MODIFY                         -> MODIFY held_write_report_ms after the first
//                                        unreported write if no close came first
// - IN_DELETE, IN_MOVED_FROM          -> REMOVE
// - IN_Q_OVERFLOW                     -> MODIFY on the root (forces a rescan)
// Directories created under a recursive watch are added as they appear.
class InotifyWatcher : public INativeWatcher {
public:
    InotifyWatcher(WatchOptions options, RawEventCallback callback);
    ~InotifyWatcher() override;

    InotifyWatcher(const InotifyWatcher &) = delete;
    InotifyWatcher &operator=(const InotifyWatcher &) = delete;

    bool start(std::string &error) override;
    void stop() override;

    // Number of directories currently watched (diagnostics/tests)
    size_t watched_directory_count() const;

private:
    void run();
    void handle_buffer(const char *buf, size_t len);
    int next_poll_timeout_ms() const;
    void report_held_writes();
    bool add_directory(const std::string &path, std::string &error);
    void add_tree(const std::string &root);
    void watch_new_directory(const std::string &path);
    void close_fds();

    WatchOptions options_;
    RawEventCallback callback_;

    int inotify_fd_ = -1;
    int wake_pipe_[2] = {-1, -1};

    mutable std::mutex wd_mutex_;
    std::unordered_map<int, std::string> wd_paths_;

    // Owned by the delivery thread
    using Clock = std::chrono::steady_clock;
    std::unordered_map<std::string, Clock::time_point> held_writes_;
    uint32_t pending_move_cookie_ = 0;
    std::string pending_move_from_;

    std::thread thread_;
    std::atomic<bool> running_{false};
};

}  // namespace watch
}  // namespace trellico
