#pragma once

/**
 * @file event_emitter.hpp
 * @brief Thread-safe fan-out event dispatcher with per-subscriber queues
 *
 * Process workers and folder watchers publish into one EventEmitter; every
 * subscriber (an SSE client, a test) drains its own bounded queue. A slow
 * subscriber loses its oldest events instead of stalling a process worker.
 *
 * publish() runs on worker and watcher threads, subscribe() on HTTP threads,
 * pop() on the subscriber's own thread.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "event_sink.hpp"
#include "event_types.hpp"

namespace trellico {
namespace events {

class EventQueue;

/**
 * @brief Handle to one subscriber's bounded queue
 *
 * The queue keeps at most N events; when a publisher finds it full the oldest
 * event is discarded so the publisher never waits. Destroying the handle
 * detaches it from the emitter.
 */
class Subscription {
public:
    using SubscriptionId = uint64_t;

    Subscription(SubscriptionId id, std::shared_ptr<EventQueue> queue, std::function<void(SubscriptionId)> detach);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Waits up to timeout_ms (0 = don't wait). nullopt on timeout or after unsubscribe
    std::optional<Event> pop(int timeout_ms = 100);
    std::optional<Event> try_pop() { return pop(0); }

    SubscriptionId id() const { return id_; }
    bool is_active() const;
    size_t queue_size() const;

    // Events discarded because this subscriber fell behind
    size_t dropped_count() const;

    void unsubscribe();

private:
    SubscriptionId id_;
    std::shared_ptr<EventQueue> queue_;
    std::function<void(SubscriptionId)> detach_;
};

/**
 * @brief Event filter for subscribers
 *
 * Empty filter = receive all events. A process_id filter passes folder events
 * through untouched (and vice versa); name matches the observable event name.
 */
struct EventFilter {
    std::string process_id;   // Empty = all processes
    std::string folder_path;  // Empty = all folders
    std::string name;         // Empty = all event names

    bool matches(const Event &event) const;

    static EventFilter all();
};

/**
 * @brief Event sink that fans out to per-subscriber queues
 *
 * Assigns a monotonic event_id to every published event.
 */
class EventEmitter : public IEventSink {
public:
    using SubscriptionId = Subscription::SubscriptionId;

    /**
     * @param default_queue_size Default max events per subscriber queue
     * @param max_subscribers Maximum concurrent subscribers (0 = unlimited)
     */
    explicit EventEmitter(size_t default_queue_size = 100, size_t max_subscribers = 32);

    /**
     * @brief Subscribe to events
     *
     * @param queue_size Queue depth, 0 for the emitter default
     * @param name Label used in overflow warnings
     * @return Subscription handle, or nullptr if max subscribers reached
     */
    std::unique_ptr<Subscription> subscribe(const EventFilter &filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string &name = "");

    void emit(Event event);

    // IEventSink
    void publish(Event event) override { emit(std::move(event)); }

    uint64_t next_event_id() const;
    size_t subscriber_count() const;
    size_t max_subscribers() const;
    bool at_capacity() const;

private:
    void detach(SubscriptionId id);

    struct Subscriber {
        std::shared_ptr<EventQueue> queue;
        EventFilter filter;
    };

    const size_t default_queue_size_;
    const size_t max_subscribers_;

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Subscriber> subscribers_;
    SubscriptionId next_subscription_id_ = 1;
    std::atomic<uint64_t> next_event_id_{1};
};

}  // namespace events
}  // namespace trellico
