#include "process_registry.hpp"

#include <algorithm>

namespace trellico {
namespace process {

bool ProcessRegistry::add(const ProcessInfo &info, std::shared_ptr<CancellationToken> token, std::string &error) {
    if (!token) {
        error = "Cancellation token is required";
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (capacity_ > 0 && entries_.size() >= capacity_) {
        error = capacity_ == 1 ? "A process is already running"
                               : "Process limit reached (" + std::to_string(capacity_) + ")";
        return false;
    }
    if (entries_.find(info.process_id) != entries_.end()) {
        error = "Process id already registered: " + info.process_id;
        return false;
    }

    entries_.emplace(info.process_id, Entry{info, std::move(token)});
    return true;
}

bool ProcessRegistry::remove(const std::string &process_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(process_id) > 0;
}

bool ProcessRegistry::cancel(const std::string &process_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(process_id);
    if (it == entries_.end()) {
        return false;
    }
    it->second.token->cancel();
    return true;
}

size_t ProcessRegistry::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[id, entry] : entries_) {
        static_cast<void>(id);
        entry.token->cancel();
    }
    return entries_.size();
}

bool ProcessRegistry::contains(const std::string &process_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(process_id) != entries_.end();
}

std::optional<ProcessInfo> ProcessRegistry::get(const std::string &process_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(process_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

std::vector<ProcessInfo> ProcessRegistry::snapshot() const {
    std::vector<ProcessInfo> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(entries_.size());
        for (const auto &[id, entry] : entries_) {
            static_cast<void>(id);
            result.push_back(entry.info);
        }
    }

    std::sort(result.begin(), result.end(), [](const ProcessInfo &a, const ProcessInfo &b) {
        if (a.started_at_ms != b.started_at_ms) {
            return a.started_at_ms < b.started_at_ms;
        }
        return a.process_id < b.process_id;
    });
    return result;
}

size_t ProcessRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace process
}  // namespace trellico
