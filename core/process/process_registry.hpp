#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cancellation_token.hpp"

namespace trellico {
namespace process {

/**
 * @brief Immutable description of one managed process
 */
struct ProcessInfo {
    std::string process_id;
    std::string provider_id;
    std::string folder_path;
    std::optional<std::string> resume_session;
    int64_t started_at_ms = 0;
};

/**
 * @brief Thread-safe process_id -> cancellation token map
 *
 * Only membership and the token live here; the execution context holds its own
 * reference to the token so polling it never touches the registry lock.
 *
 * Capacity 0 means unbounded (multi-process mode); capacity 1 is the legacy
 * single-process mode.
 *
 * Thread Safety:
 * - All methods are thread-safe, one mutex over the whole map
 * - No I/O is performed while the lock is held
 */
class ProcessRegistry {
public:
    explicit ProcessRegistry(size_t capacity = 0) : capacity_(capacity) {}

    ProcessRegistry(const ProcessRegistry &) = delete;
    ProcessRegistry &operator=(const ProcessRegistry &) = delete;

    /**
     * @brief Register a process
     *
     * @return false (and sets error) if the id is taken or capacity is reached
     */
    bool add(const ProcessInfo &info, std::shared_ptr<CancellationToken> token, std::string &error);

    /**
     * @brief Remove a process
     *
     * @return true if it was registered
     */
    bool remove(const std::string &process_id);

    /**
     * @brief Set one process's cancellation flag
     *
     * @return true if the process was registered (unknown ids are a no-op)
     */
    bool cancel(const std::string &process_id);

    // Sets every registered flag, returns how many were set
    size_t cancel_all();

    bool contains(const std::string &process_id) const;
    std::optional<ProcessInfo> get(const std::string &process_id) const;

    // Snapshot ordered by start time
    std::vector<ProcessInfo> snapshot() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    struct Entry {
        ProcessInfo info;
        std::shared_ptr<CancellationToken> token;
    };

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace process
}  // namespace trellico
