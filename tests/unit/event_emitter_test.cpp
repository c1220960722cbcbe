/**
 * event_emitter_test.cpp - EventEmitter fan-out and Subscription queue tests
 *
 * Tests:
 * 1. Basic subscription lifecycle (subscribe, emit, pop, unsubscribe)
 * 2. Queue overflow handling (drops oldest, tracks count)
 * 3. Subscriber isolation (slow subscriber doesn't block others)
 * 4. Timeout behavior (pop with timeout, try_pop)
 * 5. Event filtering (process / folder / name filters)
 * 6. Subscriber limit enforcement (max_subscribers)
 * 7. Event ID monotonicity
 * 8. Per-process ordering under concurrent publishers
 */

#include "events/event_emitter.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <thread>
#include <vector>

#include "events/event_types.hpp"

using namespace trellico::events;
using namespace std::chrono_literals;

namespace {

ProcessOutputEvent make_output(const std::string &process_id = "p1", const std::string &data = "hello",
                               const std::string &prefix = "claude") {
    ProcessOutputEvent evt;
    evt.event_prefix = prefix;
    evt.process_id = process_id;
    evt.data = data;
    evt.timestamp_ms = 1234567890;
    return evt;
}

ProcessExitEvent make_exit(const std::string &process_id = "p1", int code = 0) {
    ProcessExitEvent evt;
    evt.event_prefix = "claude";
    evt.process_id = process_id;
    evt.code = code;
    return evt;
}

FolderChangedEvent make_refresh(const std::string &folder = "/work/a",
                                RefreshSignal signal = RefreshSignal::PLANS_CHANGED) {
    FolderChangedEvent evt;
    evt.signal = signal;
    evt.folder_path = folder;
    return evt;
}

std::string data_of(const Event &event) { return std::get<ProcessOutputEvent>(event).data; }

}  // namespace

// ============================================================================
// Basic Subscription Tests
// ============================================================================

TEST(EventEmitterTest, SubscribeAndEmit) {
    EventEmitter emitter(10);

    auto sub = emitter.subscribe();
    ASSERT_NE(sub, nullptr);
    EXPECT_TRUE(sub->is_active());

    emitter.emit(make_output("p1", "chunk"));

    auto received = sub->pop(100);
    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(std::holds_alternative<ProcessOutputEvent>(*received));
    const auto &out = std::get<ProcessOutputEvent>(*received);
    EXPECT_EQ(out.process_id, "p1");
    EXPECT_EQ(out.data, "chunk");
    EXPECT_EQ(out.event_prefix, "claude");
}

TEST(EventEmitterTest, PublishIsEmit) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    IEventSink &sink = emitter;
    sink.publish(make_exit("p9", 3));

    auto received = sub->pop(100);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(std::get<ProcessExitEvent>(*received).code, 3);
}

TEST(EventEmitterTest, MultipleSubscribers) {
    EventEmitter emitter;

    auto sub1 = emitter.subscribe(EventFilter::all(), 0, "sub1");
    auto sub2 = emitter.subscribe(EventFilter::all(), 0, "sub2");
    auto sub3 = emitter.subscribe(EventFilter::all(), 0, "sub3");

    EXPECT_EQ(emitter.subscriber_count(), 3);

    emitter.emit(make_output("p1", "abc"));

    auto evt1 = sub1->pop(100);
    auto evt2 = sub2->pop(100);
    auto evt3 = sub3->pop(100);

    ASSERT_TRUE(evt1.has_value());
    ASSERT_TRUE(evt2.has_value());
    ASSERT_TRUE(evt3.has_value());
    EXPECT_EQ(data_of(*evt1), "abc");
    EXPECT_EQ(data_of(*evt2), "abc");
    EXPECT_EQ(data_of(*evt3), "abc");
}

TEST(EventEmitterTest, UnsubscribeRemovesSubscriber) {
    EventEmitter emitter;

    auto sub1 = emitter.subscribe();
    auto sub2 = emitter.subscribe();
    EXPECT_EQ(emitter.subscriber_count(), 2);

    sub1->unsubscribe();
    EXPECT_EQ(emitter.subscriber_count(), 1);

    emitter.emit(make_output());

    EXPECT_FALSE(sub1->try_pop().has_value());
    EXPECT_TRUE(sub2->pop(100).has_value());
}

TEST(EventEmitterTest, SubscriptionRAIICleanup) {
    EventEmitter emitter;

    {
        auto sub = emitter.subscribe();
        EXPECT_EQ(emitter.subscriber_count(), 1);
    }

    EXPECT_EQ(emitter.subscriber_count(), 0);
}

// ============================================================================
// Queue Overflow Tests
// ============================================================================

TEST(EventEmitterTest, QueueOverflowDropsOldest) {
    EventEmitter emitter;
    auto sub = emitter.subscribe(EventFilter::all(), 3);

    emitter.emit(make_output("p", "1"));
    emitter.emit(make_output("p", "2"));
    emitter.emit(make_output("p", "3"));

    EXPECT_EQ(sub->queue_size(), 3);
    EXPECT_EQ(sub->dropped_count(), 0);

    emitter.emit(make_output("p", "4"));

    EXPECT_EQ(sub->queue_size(), 3);
    EXPECT_EQ(sub->dropped_count(), 1);

    auto evt1 = sub->pop(100);
    auto evt2 = sub->pop(100);
    auto evt3 = sub->pop(100);
    ASSERT_TRUE(evt1.has_value());
    ASSERT_TRUE(evt2.has_value());
    ASSERT_TRUE(evt3.has_value());
    EXPECT_EQ(data_of(*evt1), "2");
    EXPECT_EQ(data_of(*evt2), "3");
    EXPECT_EQ(data_of(*evt3), "4");
}

TEST(EventEmitterTest, SlowSubscriberDoesNotBlockEmit) {
    EventEmitter emitter;

    auto slow_sub = emitter.subscribe(EventFilter::all(), 5, "slow");
    auto fast_sub = emitter.subscribe(EventFilter::all(), 100, "fast");

    for (int i = 0; i < 10; ++i) {
        emitter.emit(make_output("p", std::to_string(i)));
    }

    EXPECT_EQ(slow_sub->queue_size(), 5);
    EXPECT_EQ(slow_sub->dropped_count(), 5);

    EXPECT_EQ(fast_sub->queue_size(), 10);
    EXPECT_EQ(fast_sub->dropped_count(), 0);
}

// ============================================================================
// Timeout Tests
// ============================================================================

TEST(EventEmitterTest, PopBlocksUntilEventAvailable) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    std::thread emitter_thread([&emitter]() {
        std::this_thread::sleep_for(50ms);
        emitter.emit(make_output());
    });

    auto event = sub->pop(2000);
    EXPECT_TRUE(event.has_value());

    emitter_thread.join();
}

TEST(EventEmitterTest, PopTimesOutIfNoEvent) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    auto start = std::chrono::steady_clock::now();
    auto event = sub->pop(50);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(event.has_value());
    EXPECT_GE(elapsed, 40ms);
}

// ============================================================================
// Event Filtering Tests
// ============================================================================

TEST(EventEmitterTest, FilterByProcessId) {
    EventEmitter emitter;

    EventFilter filter;
    filter.process_id = "p1";
    auto sub = emitter.subscribe(filter);

    emitter.emit(make_output("p1", "mine"));
    emitter.emit(make_output("p2", "theirs"));
    emitter.emit(make_exit("p2"));

    auto evt = sub->pop(100);
    ASSERT_TRUE(evt.has_value());
    EXPECT_EQ(data_of(*evt), "mine");
    EXPECT_FALSE(sub->try_pop().has_value());
}

TEST(EventEmitterTest, ProcessFilterPassesFolderEvents) {
    EventEmitter emitter;

    EventFilter filter;
    filter.process_id = "p1";
    auto sub = emitter.subscribe(filter);

    emitter.emit(make_refresh("/work/a"));

    auto evt = sub->pop(100);
    ASSERT_TRUE(evt.has_value());
    EXPECT_TRUE(std::holds_alternative<FolderChangedEvent>(*evt));
}

TEST(EventEmitterTest, FilterByFolderPath) {
    EventEmitter emitter;

    EventFilter filter;
    filter.folder_path = "/work/a";
    auto sub = emitter.subscribe(filter);

    emitter.emit(make_refresh("/work/b"));
    emitter.emit(make_refresh("/work/a", RefreshSignal::RALPH_PRD_CHANGED));

    auto evt = sub->pop(100);
    ASSERT_TRUE(evt.has_value());
    EXPECT_EQ(std::get<FolderChangedEvent>(*evt).signal, RefreshSignal::RALPH_PRD_CHANGED);
    EXPECT_FALSE(sub->try_pop().has_value());
}

TEST(EventEmitterTest, FilterByName) {
    EventEmitter emitter;

    EventFilter filter;
    filter.name = "amp-exit";
    auto sub = emitter.subscribe(filter);

    emitter.emit(make_output("p1", "x", "amp"));
    auto claude_exit = make_exit("p1");
    emitter.emit(claude_exit);
    auto amp_exit = make_exit("p2", 7);
    amp_exit.event_prefix = "amp";
    emitter.emit(amp_exit);

    auto evt = sub->pop(100);
    ASSERT_TRUE(evt.has_value());
    EXPECT_EQ(std::get<ProcessExitEvent>(*evt).code, 7);
    EXPECT_FALSE(sub->try_pop().has_value());
}

// ============================================================================
// Max Subscribers Tests
// ============================================================================

TEST(EventEmitterTest, MaxSubscriberLimitEnforced) {
    EventEmitter emitter(100, 3);

    auto sub1 = emitter.subscribe();
    auto sub2 = emitter.subscribe();
    auto sub3 = emitter.subscribe();

    EXPECT_EQ(emitter.subscriber_count(), 3);
    EXPECT_TRUE(emitter.at_capacity());

    auto sub4 = emitter.subscribe();
    EXPECT_EQ(sub4, nullptr);
    EXPECT_EQ(emitter.subscriber_count(), 3);

    sub1->unsubscribe();
    EXPECT_FALSE(emitter.at_capacity());
    EXPECT_NE(emitter.subscribe(), nullptr);
}

// ============================================================================
// Event ID and Ordering Tests
// ============================================================================

TEST(EventEmitterTest, EventIDsAreMonotonic) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    emitter.emit(make_output());
    emitter.emit(make_refresh());
    emitter.emit(make_exit());

    uint64_t prev_id = 0;
    for (int i = 0; i < 3; ++i) {
        auto evt = sub->pop(100);
        ASSERT_TRUE(evt.has_value());
        uint64_t event_id = get_event_id(*evt);
        EXPECT_GT(event_id, prev_id);
        prev_id = event_id;
    }
}

TEST(EventEmitterTest, PerProcessOrderPreservedAcrossPublishers) {
    constexpr int kPerProcess = 200;
    EventEmitter emitter(4 * kPerProcess, 4);
    auto sub = emitter.subscribe();

    std::vector<std::thread> publishers;
    for (int p = 0; p < 4; ++p) {
        publishers.emplace_back([&emitter, p]() {
            const std::string id = "proc-" + std::to_string(p);
            for (int i = 0; i < kPerProcess; ++i) {
                emitter.publish(make_output(id, std::to_string(i)));
            }
        });
    }
    for (auto &t : publishers) {
        t.join();
    }

    std::map<std::string, int> next_expected;
    std::map<std::string, uint64_t> last_id;
    int total = 0;
    while (auto evt = sub->try_pop()) {
        const auto &out = std::get<ProcessOutputEvent>(*evt);
        EXPECT_EQ(std::stoi(out.data), next_expected[out.process_id]) << out.process_id;
        next_expected[out.process_id] = std::stoi(out.data) + 1;
        // Ids only increase within one publisher; across publishers they may interleave
        EXPECT_GT(out.event_id, last_id[out.process_id]) << out.process_id;
        last_id[out.process_id] = out.event_id;
        ++total;
    }
    EXPECT_EQ(total, 4 * kPerProcess);
    EXPECT_EQ(sub->dropped_count(), 0);
}
