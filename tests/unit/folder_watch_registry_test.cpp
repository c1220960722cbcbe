/**
 * folder_watch_registry_test.cpp - FolderWatchRegistry tests
 *
 * Two layers:
 * - Fake native watchers: the test fires raw events directly, so the
 *   classification and bookkeeping are checked deterministically
 * - Real inotify: the end-to-end create / rename / burst / modify / stop flows
 */

#include "watch/folder_watch_registry.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "mocks/mock_event_sink.hpp"
#include "test_helpers.hpp"
#include "watch/snapshot.hpp"

using namespace trellico;
using namespace trellico::tests;
using namespace trellico::watch;
using events::ChangeType;
using ::testing::InSequence;
using ::testing::StrictMock;
using ::testing::Truly;

namespace {

/**
 * @brief Native watcher stand-in whose callback is fired by the test
 */
class FakeWatcherHub {
public:
    struct Slot {
        RawEventCallback callback;
        bool started = false;
        bool stopped = false;
    };

    WatcherFactory factory() {
        return [this](const WatchOptions &options, RawEventCallback callback) -> std::unique_ptr<INativeWatcher> {
            std::lock_guard<std::mutex> lock(mutex_);
            auto slot = std::make_shared<Slot>();
            slot->callback = std::move(callback);
            slots_[options.path] = slot;
            options_[options.path] = options;
            return std::make_unique<FakeWatcher>(slot, fail_start_);
        };
    }

    // Deliver a raw event as the OS thread would
    void fire(const std::string &root, RawEventKind kind, const std::string &path) {
        std::shared_ptr<Slot> slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            slot = slots_.at(root);
        }
        slot->callback(RawEvent{kind, path});
    }

    std::shared_ptr<Slot> slot(const std::string &root) {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.at(root);
    }

    WatchOptions options(const std::string &root) {
        std::lock_guard<std::mutex> lock(mutex_);
        return options_.at(root);
    }

    void fail_next_start(bool fail) { fail_start_ = fail; }

private:
    class FakeWatcher : public INativeWatcher {
    public:
        FakeWatcher(std::shared_ptr<Slot> slot, bool fail) : slot_(std::move(slot)), fail_(fail) {}
        ~FakeWatcher() override { stop(); }
        bool start(std::string &error) override {
            if (fail_) {
                error = "simulated watcher failure";
                return false;
            }
            slot_->started = true;
            return true;
        }
        void stop() override { slot_->stopped = true; }

    private:
        std::shared_ptr<Slot> slot_;
        bool fail_;
    };

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;
    std::map<std::string, WatchOptions> options_;
    bool fail_start_ = false;
};

std::vector<events::PlanChangeEvent> plan_changes(const std::vector<events::Event> &evs) {
    std::vector<events::PlanChangeEvent> out;
    for (const auto &e : evs) {
        if (const auto *c = std::get_if<events::PlanChangeEvent>(&e)) {
            out.push_back(*c);
        }
    }
    return out;
}

size_t count_refresh(const std::vector<events::Event> &evs, events::RefreshSignal signal) {
    size_t n = 0;
    for (const auto &e : evs) {
        if (const auto *f = std::get_if<events::FolderChangedEvent>(&e)) {
            if (f->signal == signal) {
                ++n;
            }
        }
    }
    return n;
}

}  // namespace

class FolderWatchRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        folder = dir.str();
        registry = std::make_unique<FolderWatchRegistry>(sink, layout, hub.factory());
    }

    void TearDown() override { registry.reset(); }

    std::string plans() const { return layout.plans_path(folder); }
    std::string plan(const std::string &stem) const { return plans() + "/" + stem + ".md"; }

    TempDir dir;
    std::string folder;
    WatchLayout layout;
    FakeWatcherHub hub;
    RecordingSink sink;
    std::unique_ptr<FolderWatchRegistry> registry;
};

TEST_F(FolderWatchRegistryTest, WatchCreatesDirectoryAndSeedsKnownSet) {
    write_file(plan("existing"), "# plan");

    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;

    EXPECT_TRUE(fs::is_directory(plans()));
    EXPECT_TRUE(registry->is_watching(folder));
    EXPECT_TRUE(registry->is_watching(folder, WatchKind::PLANS));
    EXPECT_FALSE(registry->is_watching(folder, WatchKind::RALPH_PRDS));
    EXPECT_EQ(registry->known_set(folder, WatchKind::PLANS), std::optional<StemSet>(StemSet{"existing"}));
    EXPECT_TRUE(hub.slot(plans())->started);
    EXPECT_TRUE(hub.options(plans()).recursive);
    EXPECT_TRUE(sink.snapshot().empty());
}

TEST_F(FolderWatchRegistryTest, CreateYieldsCreatedThenRefresh) {
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;

    write_file(plan("a"), "x");
    hub.fire(plans(), RawEventKind::CREATE, plan("a"));

    auto evs = sink.snapshot();
    ASSERT_EQ(evs.size(), 2u);
    auto changes = plan_changes(evs);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].change_type, ChangeType::CREATED);
    EXPECT_EQ(changes[0].file_name, "a");
    EXPECT_EQ(changes[0].folder_path, folder);
    ASSERT_TRUE(std::holds_alternative<events::FolderChangedEvent>(evs[1]));
    EXPECT_EQ(events::event_name(evs[1]), "plans-changed");
}

TEST_F(FolderWatchRegistryTest, RenameYieldsSingleRenamed) {
    write_file(plan("a"), "x");
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;

    fs::rename(plan("a"), plan("b"));
    hub.fire(plans(), RawEventKind::REMOVE, plan("a"));
    hub.fire(plans(), RawEventKind::CREATE, plan("b"));

    auto changes = plan_changes(sink.snapshot());
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].change_type, ChangeType::RENAMED);
    EXPECT_EQ(changes[0].file_name, "b");
    EXPECT_EQ(changes[0].old_file_name, std::optional<std::string>("a"));
    // The second raw event finds nothing new but still signals a refresh
    EXPECT_EQ(count_refresh(sink.snapshot(), events::RefreshSignal::PLANS_CHANGED), 2u);
}

TEST_F(FolderWatchRegistryTest, BurstIsNotMistakenForRename) {
    write_file(plan("z"), "x");
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;

    write_file(plan("x"), "x");
    write_file(plan("y"), "y");
    fs::remove(plan("z"));
    hub.fire(plans(), RawEventKind::CREATE, plan("x"));

    auto changes = plan_changes(sink.snapshot());
    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0].change_type, ChangeType::CREATED);
    EXPECT_EQ(changes[0].file_name, "x");
    EXPECT_EQ(changes[1].change_type, ChangeType::CREATED);
    EXPECT_EQ(changes[1].file_name, "y");
    EXPECT_EQ(changes[2].change_type, ChangeType::REMOVED);
    EXPECT_EQ(changes[2].file_name, "z");
}

TEST_F(FolderWatchRegistryTest, ModifyOfKnownFile) {
    write_file(plan("a"), "x");
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;

    write_file(plan("a"), "edited");
    hub.fire(plans(), RawEventKind::MODIFY, plan("a"));

    auto changes = plan_changes(sink.snapshot());
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].change_type, ChangeType::MODIFIED);
    EXPECT_EQ(changes[0].file_name, "a");
    EXPECT_FALSE(changes[0].old_file_name.has_value());
}

TEST_F(FolderWatchRegistryTest, KnownSetConvergesToScan) {
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;

    write_file(plan("a"), "1");
    hub.fire(plans(), RawEventKind::CREATE, plan("a"));
    write_file(plan("b"), "2");
    fs::rename(plan("a"), plan("c"));
    hub.fire(plans(), RawEventKind::CREATE, plan("c"));
    write_file(plans() + "/ignored.txt", "3");
    hub.fire(plans(), RawEventKind::CREATE, plans() + "/ignored.txt");

    StemSet scan;
    ASSERT_TRUE(scan_plan_stems(plans(), ".md", scan, error)) << error;
    EXPECT_EQ(registry->known_set(folder, WatchKind::PLANS), std::optional<StemSet>(scan));
}

TEST_F(FolderWatchRegistryTest, StopWatchingSilencesInFlightCallbacks) {
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;
    auto slot = hub.slot(plans());

    EXPECT_TRUE(registry->stop_watching(folder));
    EXPECT_TRUE(slot->stopped);
    EXPECT_FALSE(registry->is_watching(folder));
    EXPECT_FALSE(registry->stop_watching(folder));

    // A callback that was already on its way must not publish
    write_file(plan("late"), "x");
    slot->callback(RawEvent{RawEventKind::CREATE, plan("late")});
    EXPECT_TRUE(sink.snapshot().empty());
}

TEST_F(FolderWatchRegistryTest, RewatchReplacesWatcherAndKnownSet) {
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;
    auto first = hub.slot(plans());

    write_file(plan("a"), "x");
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;
    EXPECT_TRUE(first->stopped);
    EXPECT_EQ(registry->known_set(folder, WatchKind::PLANS), std::optional<StemSet>(StemSet{"a"}));

    // The replaced watcher's callback is stale
    first->callback(RawEvent{RawEventKind::CREATE, plan("a")});
    EXPECT_TRUE(sink.snapshot().empty());
}

TEST_F(FolderWatchRegistryTest, StartFailureIsReportedAndLeavesNoEntry) {
    hub.fail_next_start(true);
    std::string error;
    EXPECT_FALSE(registry->watch(folder, WatchKind::PLANS, error));
    EXPECT_EQ(error, "simulated watcher failure");
    EXPECT_FALSE(registry->is_watching(folder));
}

TEST_F(FolderWatchRegistryTest, DirectoryCreationFailureIsReported) {
    // A regular file where the state directory should be
    write_file(dir.path() / ".trellico", "not a directory");
    std::string error;
    EXPECT_FALSE(registry->watch(folder, WatchKind::PLANS, error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(registry->is_watching(folder));
}

TEST_F(FolderWatchRegistryTest, PrdWatchPublishesRefreshOnly) {
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::RALPH_PRDS, error)) << error;
    const std::string root = layout.prd_path(folder);

    write_file(root + "/feature/prd.json", "{}");
    hub.fire(root, RawEventKind::MODIFY, root + "/feature/prd.json");

    auto evs = sink.snapshot();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(events::event_name(evs[0]), "ralph-prd-changed");
    EXPECT_EQ(registry->known_set(folder, WatchKind::RALPH_PRDS), std::optional<StemSet>(StemSet{"feature"}));
}

TEST_F(FolderWatchRegistryTest, IterationsWatchMatchesOnlyItsFile) {
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::RALPH_ITERATIONS, error)) << error;
    const std::string root = layout.state_path(folder);
    EXPECT_FALSE(hub.options(root).recursive);

    hub.fire(root, RawEventKind::MODIFY, root + "/other.json");
    EXPECT_TRUE(sink.snapshot().empty());

    hub.fire(root, RawEventKind::MODIFY, layout.iterations_path(folder));
    auto evs = sink.snapshot();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(events::event_name(evs[0]), "ralph-iterations-changed");
    EXPECT_FALSE(registry->known_set(folder, WatchKind::RALPH_ITERATIONS).has_value());
}

TEST_F(FolderWatchRegistryTest, KindsShareOneFolderEntry) {
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::RALPH_PRDS, error)) << error;

    EXPECT_EQ(registry->watched_folders(), std::vector<std::string>{folder});
    EXPECT_EQ(registry->watched_kinds(folder), (std::vector<WatchKind>{WatchKind::PLANS, WatchKind::RALPH_PRDS}));

    auto plans_slot = hub.slot(plans());
    auto prd_slot = hub.slot(layout.prd_path(folder));
    registry->stop_watching(folder);
    EXPECT_TRUE(plans_slot->stopped);
    EXPECT_TRUE(prd_slot->stopped);
}

TEST_F(FolderWatchRegistryTest, FolderIsolation) {
    TempDir other;
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;
    ASSERT_TRUE(registry->watch(other.str(), WatchKind::PLANS, error)) << error;

    registry->stop_watching(other.str());

    write_file(plan("a"), "x");
    hub.fire(plans(), RawEventKind::CREATE, plan("a"));
    auto changes = plan_changes(sink.snapshot());
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].folder_path, folder);
}

TEST(FolderWatchRegistryMockTest, PublishesChangeBeforeRefresh) {
    TempDir dir;
    FakeWatcherHub hub;
    StrictMock<MockEventSink> sink;
    WatchLayout layout;
    FolderWatchRegistry registry(sink, layout, hub.factory());

    std::string error;
    ASSERT_TRUE(registry.watch(dir.str(), WatchKind::PLANS, error)) << error;

    {
        InSequence seq;
        EXPECT_CALL(sink, publish(Truly([](const events::Event &e) {
                        return std::holds_alternative<events::PlanChangeEvent>(e);
                    })));
        EXPECT_CALL(sink, publish(Truly([](const events::Event &e) {
                        return std::holds_alternative<events::FolderChangedEvent>(e);
                    })));
    }

    const std::string plans = layout.plans_path(dir.str());
    write_file(plans + "/a.md", "x");
    hub.fire(plans, RawEventKind::CREATE, plans + "/a.md");
}

// ============================================================================
// End-to-end with inotify
// ============================================================================

class FolderWatchRegistryInotifyTest : public ::testing::Test {
protected:
    void SetUp() override {
        folder = dir.str();
        registry = std::make_unique<FolderWatchRegistry>(sink, layout);
    }

    void TearDown() override { registry.reset(); }

    std::string plan(const std::string &stem) const { return layout.plans_path(folder) + "/" + stem + ".md"; }

    bool wait_for_change(ChangeType type, const std::string &name) {
        return sink.wait_for([&](const std::vector<events::Event> &evs) {
            for (const auto &c : plan_changes(evs)) {
                if (c.change_type == type && c.file_name == name) {
                    return true;
                }
            }
            return false;
        });
    }

    TempDir dir;
    std::string folder;
    WatchLayout layout;
    RecordingSink sink;
    std::unique_ptr<FolderWatchRegistry> registry;
};

TEST_F(FolderWatchRegistryInotifyTest, CreateThenRename) {
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;

    place_file(plan("a"), "# a");
    ASSERT_TRUE(wait_for_change(ChangeType::CREATED, "a"));

    fs::rename(plan("a"), plan("b"));
    ASSERT_TRUE(sink.wait_for([](const std::vector<events::Event> &evs) {
        for (const auto &c : plan_changes(evs)) {
            if (c.change_type == ChangeType::RENAMED) {
                return true;
            }
        }
        return false;
    }));

    auto changes = plan_changes(sink.snapshot());
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[1].file_name, "b");
    EXPECT_EQ(changes[1].old_file_name, std::optional<std::string>("a"));
}

TEST_F(FolderWatchRegistryInotifyTest, EditingKnownFileYieldsModified) {
    write_file(plan("a"), "v1");
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;

    write_file(plan("a"), "v2");
    ASSERT_TRUE(wait_for_change(ChangeType::MODIFIED, "a"));

    for (const auto &c : plan_changes(sink.snapshot())) {
        EXPECT_EQ(c.change_type, ChangeType::MODIFIED);
        EXPECT_EQ(c.file_name, "a");
    }
}

TEST_F(FolderWatchRegistryInotifyTest, SaveByRenameOverKnownFileYieldsModified) {
    write_file(plan("a"), "v1");
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;

    const std::string temp = layout.plans_path(folder) + "/.a.md.swp";
    write_file(temp, "v2");
    fs::rename(temp, plan("a"));
    ASSERT_TRUE(wait_for_change(ChangeType::MODIFIED, "a"));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto changes = plan_changes(sink.snapshot());
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].change_type, ChangeType::MODIFIED);
    EXPECT_EQ(changes[0].file_name, "a");
    EXPECT_EQ(registry->known_set(folder, WatchKind::PLANS), std::optional<StemSet>(StemSet{"a"}));
}

TEST_F(FolderWatchRegistryInotifyTest, RenameBetweenPlansIsNotAlsoModified) {
    write_file(plan("a"), "x");
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;

    fs::rename(plan("a"), plan("b"));
    ASSERT_TRUE(wait_for_change(ChangeType::RENAMED, "b"));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto changes = plan_changes(sink.snapshot());
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].old_file_name, std::optional<std::string>("a"));
}

TEST_F(FolderWatchRegistryInotifyTest, NoEventsAfterStopWatching) {
    std::string error;
    ASSERT_TRUE(registry->watch(folder, WatchKind::PLANS, error)) << error;
    ASSERT_TRUE(registry->stop_watching(folder));

    write_file(plan("late"), "x");
    fs::rename(plan("late"), plan("later"));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_TRUE(sink.snapshot().empty());
}
