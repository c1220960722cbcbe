#include "event_emitter.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace trellico {
namespace events {

namespace {
// First overflow of a queue is logged, then one warning per this many drops
constexpr size_t kDropLogInterval = 100;
}  // namespace

/**
 * @brief Bounded drop-oldest queue behind one Subscription
 */
class EventQueue {
public:
    EventQueue(size_t capacity, std::string name) : capacity_(capacity == 0 ? 1 : capacity), name_(std::move(name)) {}

    void push(const Event &event) {
        size_t dropped_total = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            if (events_.size() >= capacity_) {
                events_.pop_front();
                dropped_total = ++dropped_;
            }
            events_.push_back(event);
        }
        cv_.notify_one();

        if (dropped_total % kDropLogInterval == 1) {
            LOG_WARN("[EventEmitter] Subscriber '" << name_ << "' is behind, dropped " << dropped_total
                                                    << " event(s) so far");
        }
    }

    std::optional<Event> pop(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (timeout_ms > 0) {
            cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return closed_ || !events_.empty(); });
        }
        if (closed_ || events_.empty()) {
            return std::nullopt;
        }
        Event event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            events_.clear();
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    const size_t capacity_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
    size_t dropped_ = 0;
    bool closed_ = false;
};

//=============================================================================
// Subscription
//=============================================================================

Subscription::Subscription(SubscriptionId id, std::shared_ptr<EventQueue> queue,
                           std::function<void(SubscriptionId)> detach)
    : id_(id), queue_(std::move(queue)), detach_(std::move(detach)) {}

Subscription::~Subscription() { unsubscribe(); }

std::optional<Event> Subscription::pop(int timeout_ms) { return queue_->pop(timeout_ms); }

bool Subscription::is_active() const { return !queue_->closed(); }

size_t Subscription::queue_size() const { return queue_->size(); }

size_t Subscription::dropped_count() const { return queue_->dropped(); }

void Subscription::unsubscribe() {
    if (detach_) {
        auto detach = std::move(detach_);
        detach_ = nullptr;
        detach(id_);
    }
    queue_->close();
}

//=============================================================================
// EventFilter
//=============================================================================

bool EventFilter::matches(const Event &event) const {
    // Scope filters only reject events that carry the other value
    auto scope_mismatch = [](const std::string &wanted, const std::string &actual) {
        return !wanted.empty() && !actual.empty() && wanted != actual;
    };

    if (scope_mismatch(process_id, get_process_id(event)) || scope_mismatch(folder_path, get_folder_path(event))) {
        return false;
    }
    return name.empty() || event_name(event) == name;
}

EventFilter EventFilter::all() { return EventFilter{}; }

//=============================================================================
// EventEmitter
//=============================================================================

EventEmitter::EventEmitter(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size), max_subscribers_(max_subscribers) {}

std::unique_ptr<Subscription> EventEmitter::subscribe(const EventFilter &filter, size_t queue_size,
                                                      const std::string &name) {
    auto queue = std::make_shared<EventQueue>(queue_size > 0 ? queue_size : default_queue_size_, name);

    SubscriptionId id = 0;
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (max_subscribers_ > 0 && subscribers_.size() >= max_subscribers_) {
            total = subscribers_.size();
        } else {
            id = next_subscription_id_++;
            subscribers_.emplace(id, Subscriber{queue, filter});
            total = subscribers_.size();
        }
    }

    if (id == 0) {
        LOG_WARN("[EventEmitter] Rejecting subscriber" << (name.empty() ? "" : " '" + name + "'") << ": " << total
                                                       << " of " << max_subscribers_ << " slots in use");
        return nullptr;
    }

    LOG_DEBUG("[EventEmitter] Subscriber " << id << (name.empty() ? "" : " '" + name + "'") << " attached (" << total
                                           << " total)");
    return std::make_unique<Subscription>(id, std::move(queue), [this](SubscriptionId sub_id) { detach(sub_id); });
}

void EventEmitter::emit(Event event) {
    std::vector<std::shared_ptr<EventQueue>> targets;
    {
        // Ids are unique and increasing per emit() call. Queues are pushed after
        // unlock, so only events from one publishing thread arrive in id order
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t id = next_event_id_++;
        std::visit([id](auto &e) { e.event_id = id; }, event);

        targets.reserve(subscribers_.size());
        for (const auto &entry : subscribers_) {
            if (entry.second.filter.matches(event)) {
                targets.push_back(entry.second.queue);
            }
        }
    }

    for (const auto &queue : targets) {
        queue->push(event);
    }
}

uint64_t EventEmitter::next_event_id() const { return next_event_id_.load(); }

size_t EventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

size_t EventEmitter::max_subscribers() const { return max_subscribers_; }

bool EventEmitter::at_capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_subscribers_ > 0 && subscribers_.size() >= max_subscribers_;
}

void EventEmitter::detach(SubscriptionId id) {
    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (subscribers_.erase(id) == 0) {
            return;
        }
        remaining = subscribers_.size();
    }
    LOG_DEBUG("[EventEmitter] Subscriber " << id << " detached (" << remaining << " remaining)");
}

}  // namespace events
}  // namespace trellico
