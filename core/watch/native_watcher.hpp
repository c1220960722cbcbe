#pragma once

#include <functional>
#include <memory>
#include <string>

#include "watch_types.hpp"

namespace trellico {
namespace watch {

using RawEventCallback = std::function<void(const RawEvent &)>;

struct WatchOptions {
    std::string path;
    bool recursive = true;
    // Writes to a file its writer keeps open are reported after this delay
    int held_write_report_ms = 1000;
};

/**
 * @brief OS notification source for one directory tree
 *
 * Callbacks are delivered on a thread owned by the watcher and are serialized
 * per watcher. Destroying a watcher stops it and waits for an in-flight
 * callback to return, so it must never be destroyed from its own callback.
 */
class INativeWatcher {
public:
    virtual ~INativeWatcher() = default;

    // Begin delivering events. Returns false on failure (sets error)
    virtual bool start(std::string &error) = 0;

    // Idempotent; blocks until the delivery thread has exited
    virtual void stop() = 0;
};

using WatcherFactory =
    std::function<std::unique_ptr<INativeWatcher>(const WatchOptions &options, RawEventCallback callback)>;

// inotify-backed factory
WatcherFactory default_watcher_factory();

}  // namespace watch
}  // namespace trellico
