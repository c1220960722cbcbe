#include "inotify_watcher.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"

namespace trellico {
namespace watch {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_MOVED_TO | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM |
                                IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;

}  // namespace

WatcherFactory default_watcher_factory() {
    return [](const WatchOptions &options, RawEventCallback callback) -> std::unique_ptr<INativeWatcher> {
        return std::make_unique<InotifyWatcher>(options, std::move(callback));
    };
}

InotifyWatcher::InotifyWatcher(WatchOptions options, RawEventCallback callback)
    : options_(std::move(options)), callback_(std::move(callback)) {}

InotifyWatcher::~InotifyWatcher() { stop(); }

bool InotifyWatcher::start(std::string &error) {
    if (running_.load()) {
        error = "Watcher already started";
        return false;
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        error = std::string("Failed to create watcher: ") + std::strerror(errno);
        return false;
    }

    if (pipe2(wake_pipe_, O_NONBLOCK | O_CLOEXEC) < 0) {
        error = std::string("Failed to create watcher: ") + std::strerror(errno);
        close_fds();
        return false;
    }

    if (!add_directory(options_.path, error)) {
        close_fds();
        return false;
    }

    if (options_.recursive) {
        add_tree(options_.path);
    }

    running_ = true;
    try {
        thread_ = std::thread(&InotifyWatcher::run, this);
    } catch (const std::system_error &e) {
        running_ = false;
        error = std::string("Failed to start watcher thread: ") + e.what();
        close_fds();
        return false;
    }

    LOG_DEBUG("[Watch] inotify watching " << options_.path << (options_.recursive ? " (recursive)" : ""));
    return true;
}

void InotifyWatcher::stop() {
    if (running_.exchange(false)) {
        const char wake = 'x';
        ssize_t written;
        do {
            written = write(wake_pipe_[1], &wake, 1);
        } while (written < 0 && errno == EINTR);
    }

    if (thread_.joinable()) {
        thread_.join();
    }
    close_fds();
}

size_t InotifyWatcher::watched_directory_count() const {
    std::lock_guard<std::mutex> lock(wd_mutex_);
    return wd_paths_.size();
}

bool InotifyWatcher::add_directory(const std::string &path, std::string &error) {
    int wd = inotify_add_watch(inotify_fd_, path.c_str(), kWatchMask);
    if (wd < 0) {
        error = "Failed to watch directory " + path + ": " + std::strerror(errno);
        return false;
    }

    std::lock_guard<std::mutex> lock(wd_mutex_);
    wd_paths_[wd] = path;
    return true;
}

void InotifyWatcher::add_tree(const std::string &root) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARN("[Watch] Failed to walk " << root << ": " << ec.message());
        return;
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARN("[Watch] Failed to walk " << root << ": " << ec.message());
            return;
        }
        std::error_code type_ec;
        if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
            std::string error;
            if (!add_directory(it->path().string(), error)) {
                LOG_WARN("[Watch] " << error);
            }
        }
    }
}

void InotifyWatcher::run() {
    // Large enough for many events; inotify never splits an event across reads
    alignas(struct inotify_event) char buffer[16 * 1024];

    while (running_.load()) {
        struct pollfd fds[2] {};
        fds[0].fd = inotify_fd_;
        fds[0].events = POLLIN;
        fds[1].fd = wake_pipe_[0];
        fds[1].events = POLLIN;

        int rc = poll(fds, 2, next_poll_timeout_ms());
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[Watch] poll failed on " << options_.path << ": " << std::strerror(errno));
            break;
        }

        if (fds[1].revents != 0) {
            break;
        }
        if ((fds[0].revents & POLLIN) == 0) {
            report_held_writes();
            continue;
        }

        while (true) {
            ssize_t n = read(inotify_fd_, buffer, sizeof(buffer));
            if (n > 0) {
                handle_buffer(buffer, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            // EAGAIN: drained
            break;
        }
        report_held_writes();
    }
}

int InotifyWatcher::next_poll_timeout_ms() const {
    if (held_writes_.empty()) {
        return -1;
    }
    const auto interval = std::chrono::milliseconds(options_.held_write_report_ms);
    const auto now = Clock::now();
    auto wait = interval;
    for (const auto &[path, since] : held_writes_) {
        static_cast<void>(path);
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(since + interval - now);
        wait = std::min(wait, remaining);
    }
    return static_cast<int>(std::max<std::chrono::milliseconds::rep>(wait.count(), 0));
}

void InotifyWatcher::report_held_writes() {
    const auto interval = std::chrono::milliseconds(options_.held_write_report_ms);
    const auto now = Clock::now();
    for (auto it = held_writes_.begin(); it != held_writes_.end();) {
        if (!running_.load()) {
            return;
        }
        if (now - it->second < interval) {
            ++it;
            continue;
        }
        const std::string path = it->first;
        it = held_writes_.erase(it);
        callback_(RawEvent{RawEventKind::MODIFY, path, {}});
    }
}

void InotifyWatcher::handle_buffer(const char *buf, size_t len) {
    size_t offset = 0;
    while (offset < len) {
        const auto *event = reinterpret_cast<const struct inotify_event *>(buf + offset);
        offset += sizeof(struct inotify_event) + event->len;

        if (!running_.load()) {
            return;
        }

        if (event->mask & IN_Q_OVERFLOW) {
            LOG_WARN("[Watch] Event queue overflow on " << options_.path << ", forcing rescan");
            callback_(RawEvent{RawEventKind::MODIFY, options_.path, {}});
            continue;
        }

        std::string dir;
        {
            std::lock_guard<std::mutex> lock(wd_mutex_);
            auto it = wd_paths_.find(event->wd);
            if (it == wd_paths_.end()) {
                continue;
            }
            dir = it->second;
            if (event->mask & IN_IGNORED) {
                wd_paths_.erase(it);
                continue;
            }
        }

        if (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF)) {
            // The kernel follows with IN_IGNORED; report so observers rescan
            callback_(RawEvent{RawEventKind::REMOVE, dir, {}});
            continue;
        }

        const std::string path = event->len > 0 ? (fs::path(dir) / event->name).string() : dir;

        if (event->mask & IN_CREATE) {
            if ((event->mask & IN_ISDIR) && options_.recursive) {
                watch_new_directory(path);
            }
            callback_(RawEvent{RawEventKind::CREATE, path, {}});
        } else if (event->mask & IN_MOVED_TO) {
            if ((event->mask & IN_ISDIR) && options_.recursive) {
                watch_new_directory(path);
            }
            // A rename target replaces content at path, as an editor's save-by-rename does
            RawEvent raw{RawEventKind::MODIFY, path, {}};
            if (pending_move_cookie_ != 0 && event->cookie == pending_move_cookie_) {
                raw.moved_from = std::move(pending_move_from_);
            }
            pending_move_cookie_ = 0;
            pending_move_from_.clear();
            held_writes_.erase(path);
            callback_(raw);
        } else if (event->mask & IN_CLOSE_WRITE) {
            held_writes_.erase(path);
            callback_(RawEvent{RawEventKind::MODIFY, path, {}});
        } else if (event->mask & IN_MODIFY) {
            // First unreported write starts the clock; close or the timer reports it
            held_writes_.emplace(path, Clock::now());
        } else if (event->mask & (IN_DELETE | IN_MOVED_FROM)) {
            if (event->mask & IN_MOVED_FROM) {
                pending_move_cookie_ = event->cookie;
                pending_move_from_ = path;
            }
            held_writes_.erase(path);
            callback_(RawEvent{RawEventKind::REMOVE, path, {}});
        }
    }
}

void InotifyWatcher::watch_new_directory(const std::string &path) {
    std::string error;
    if (add_directory(path, error)) {
        add_tree(path);
    } else {
        LOG_DEBUG("[Watch] " << error);
    }
}

void InotifyWatcher::close_fds() {
    if (inotify_fd_ >= 0) {
        close(inotify_fd_);
        inotify_fd_ = -1;
    }
    for (int &fd : wake_pipe_) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
    held_writes_.clear();
    pending_move_cookie_ = 0;
    pending_move_from_.clear();

    std::lock_guard<std::mutex> lock(wd_mutex_);
    wd_paths_.clear();
}

}  // namespace watch
}  // namespace trellico
