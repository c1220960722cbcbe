/**
 * process_supervisor_test.cpp - ProcessSupervisor end-to-end tests
 *
 * Providers are shell scripts registered through ConfiguredProviderDescriptor,
 * so every test drives a real pseudo-terminal and a real child process.
 */

#include "process/process_supervisor.hpp"

#include <gtest/gtest.h>

#include <csignal>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "provider/provider_catalog.hpp"
#include "test_helpers.hpp"

using namespace trellico;
using namespace trellico::tests;

class ProcessSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        workdir = std::make_unique<TempDir>("trellico_supervisor");
        fs::create_directories(workdir->path() / "project");
        catalog = std::make_unique<provider::ProviderCatalog>();
    }

    void TearDown() override {
        supervisor.reset();
        catalog.reset();
        workdir.reset();
    }

    // Registers a provider whose binary is a script with the given body
    void add_script_provider(const std::string &id, const std::string &body) {
        provider::ProviderConfig config;
        config.id = id;
        config.display_name = "Fake " + id;
        config.event_prefix = "fake";
        config.search_paths = {write_script(workdir->path() / "bin" / id, body)};
        catalog->add(std::make_shared<provider::ConfiguredProviderDescriptor>(config));
    }

    void make_supervisor(process::SupervisorConfig config = process::SupervisorConfig{}) {
        config.cancel_poll_ms = 20;
        supervisor = std::make_unique<process::ProcessSupervisor>(*catalog, sink, config);
    }

    process::StartRequest request(const std::string &provider_id, const std::string &message = "hello") {
        process::StartRequest req;
        req.provider_id = provider_id;
        req.message = message;
        req.folder_path = project();
        return req;
    }

    std::string start_ok(const process::StartRequest &req) {
        std::string error;
        auto id = supervisor->start(req, error);
        EXPECT_TRUE(id.has_value()) << error;
        return id.value_or("");
    }

    std::string project() const { return (workdir->path() / "project").string(); }

    // Exactly one terminal event for id, and it is the last event for id
    void expect_single_terminal(const std::string &id) {
        auto evs = sink.for_process(id);
        int terminals = 0;
        for (const auto &e : evs) {
            if (events::is_terminal_process_event(e)) {
                ++terminals;
            }
        }
        EXPECT_EQ(terminals, 1) << id;
        ASSERT_FALSE(evs.empty());
        EXPECT_TRUE(events::is_terminal_process_event(evs.back())) << id;
    }

    std::unique_ptr<TempDir> workdir;
    std::unique_ptr<provider::ProviderCatalog> catalog;
    RecordingSink sink;
    std::unique_ptr<process::ProcessSupervisor> supervisor;
};

TEST_F(ProcessSupervisorTest, StreamsOutputThenExitCode) {
    add_script_provider("echo", "echo \"hello from $(basename \"$(pwd -P)\")\"\nexit 3");
    make_supervisor();

    auto id = start_ok(request("echo"));
    ASSERT_TRUE(sink.wait_for_terminal(id));

    EXPECT_NE(sink.output_of(id).find("hello from project"), std::string::npos) << sink.output_of(id);
    auto evs = sink.for_process(id);
    ASSERT_TRUE(std::holds_alternative<events::ProcessExitEvent>(evs.back()));
    EXPECT_EQ(std::get<events::ProcessExitEvent>(evs.back()).code, 3);
    EXPECT_EQ(events::event_name(evs.back()), "fake-exit");
    expect_single_terminal(id);
    EXPECT_FALSE(supervisor->is_registered(id));
}

TEST_F(ProcessSupervisorTest, DistinctIdsEachWithOneTerminalEvent) {
    add_script_provider("quick", "echo tick\nexit 0");
    make_supervisor();

    std::set<std::string> ids;
    for (int i = 0; i < 6; ++i) {
        ids.insert(start_ok(request("quick")));
    }
    EXPECT_EQ(ids.size(), 6u);

    for (const auto &id : ids) {
        ASSERT_TRUE(sink.wait_for_terminal(id)) << id;
    }
    ASSERT_TRUE(supervisor->wait_idle(5000));
    for (const auto &id : ids) {
        expect_single_terminal(id);
    }
    EXPECT_EQ(supervisor->running_count(), 0u);
}

TEST_F(ProcessSupervisorTest, StopYieldsExitNotError) {
    add_script_provider("sleeper", "echo started\nexec sleep 30");
    make_supervisor();

    auto id = start_ok(request("sleeper"));
    ASSERT_TRUE(sink.wait_for([&](const std::vector<events::Event> &evs) {
        for (const auto &e : evs) {
            if (std::holds_alternative<events::ProcessOutputEvent>(e)) {
                return true;
            }
        }
        return false;
    }));
    EXPECT_TRUE(supervisor->is_registered(id));

    EXPECT_EQ(supervisor->stop(id), 1u);
    ASSERT_TRUE(sink.wait_for_terminal(id));

    auto evs = sink.for_process(id);
    ASSERT_TRUE(std::holds_alternative<events::ProcessExitEvent>(evs.back()));
    EXPECT_EQ(std::get<events::ProcessExitEvent>(evs.back()).code, 128 + SIGKILL);
    expect_single_terminal(id);
}

TEST_F(ProcessSupervisorTest, StopWithoutIdCancelsEveryProcess) {
    add_script_provider("sleeper", "exec sleep 30");
    make_supervisor();

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(start_ok(request("sleeper")));
    }

    EXPECT_EQ(supervisor->stop(), 3u);
    for (const auto &id : ids) {
        ASSERT_TRUE(sink.wait_for_terminal(id)) << id;
        expect_single_terminal(id);
    }
    EXPECT_EQ(supervisor->running_count(), 0u);
}

TEST_F(ProcessSupervisorTest, StopUnknownIdIsNoop) {
    add_script_provider("quick", "exit 0");
    make_supervisor();

    EXPECT_EQ(supervisor->stop(std::string("not-a-process")), 0u);
    EXPECT_EQ(supervisor->stop(), 0u);
    EXPECT_TRUE(sink.snapshot().empty());

    // Stopping a finished process is also a no-op
    auto id = start_ok(request("quick"));
    ASSERT_TRUE(sink.wait_for_terminal(id));
    const size_t before = sink.snapshot().size();
    EXPECT_EQ(supervisor->stop(id), 0u);
    EXPECT_EQ(sink.snapshot().size(), before);
}

TEST_F(ProcessSupervisorTest, MissingBinaryIsReportedAsErrorEvent) {
    provider::ProviderConfig config;
    config.id = "ghost";
    config.event_prefix = "ghost";
    config.binary_name = "trellico-no-such-binary";
    config.search_paths = {(workdir->path() / "nowhere").string()};
    catalog->add(std::make_shared<provider::ConfiguredProviderDescriptor>(config));
    make_supervisor();

    auto id = start_ok(request("ghost"));
    ASSERT_TRUE(sink.wait_for_terminal(id));

    auto evs = sink.for_process(id);
    ASSERT_EQ(evs.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<events::ProcessErrorEvent>(evs[0]));
    EXPECT_NE(std::get<events::ProcessErrorEvent>(evs[0]).error.find("not found"), std::string::npos);
    EXPECT_EQ(events::event_name(evs[0]), "ghost-error");
}

TEST_F(ProcessSupervisorTest, MissingWorkingDirectoryIsReportedAsErrorEvent) {
    add_script_provider("quick", "exit 0");
    make_supervisor();

    auto req = request("quick");
    req.folder_path = (workdir->path() / "does-not-exist").string();
    auto id = start_ok(req);
    ASSERT_TRUE(sink.wait_for_terminal(id));

    auto evs = sink.for_process(id);
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<events::ProcessErrorEvent>(evs[0]));
}

TEST_F(ProcessSupervisorTest, SynchronousValidation) {
    add_script_provider("quick", "exit 0");
    make_supervisor();
    std::string error;

    auto req = request("quick", "");
    EXPECT_FALSE(supervisor->start(req, error).has_value());
    EXPECT_EQ(error, "message must not be empty");

    req = request("quick");
    req.folder_path.clear();
    EXPECT_FALSE(supervisor->start(req, error).has_value());
    EXPECT_EQ(error, "folder_path must not be empty");

    EXPECT_FALSE(supervisor->start(request("codex"), error).has_value());
    EXPECT_EQ(error, "Unknown provider: codex");

    EXPECT_TRUE(sink.snapshot().empty());
}

TEST_F(ProcessSupervisorTest, ResumeSessionIsForwardedToArgs) {
    add_script_provider("args", "echo \"argv:$*\"");
    make_supervisor();

    auto req = request("args", "next step");
    req.resume_session = "sess-42";
    auto id = start_ok(req);
    ASSERT_TRUE(sink.wait_for_terminal(id));

    const std::string out = sink.output_of(id);
    EXPECT_NE(out.find("--resume sess-42 next step"), std::string::npos) << out;
}

TEST_F(ProcessSupervisorTest, ListShowsRunningProcesses) {
    add_script_provider("sleeper", "exec sleep 30");
    make_supervisor();

    auto req = request("sleeper");
    req.resume_session = "s1";
    auto id = start_ok(req);

    auto list = supervisor->list();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].process_id, id);
    EXPECT_EQ(list[0].provider_id, "sleeper");
    EXPECT_EQ(list[0].folder_path, project());
    EXPECT_EQ(list[0].resume_session, std::optional<std::string>("s1"));

    supervisor->stop(id);
    ASSERT_TRUE(sink.wait_for_terminal(id));
    EXPECT_TRUE(supervisor->list().empty());
}

TEST_F(ProcessSupervisorTest, SingleModeAllowsOneProcessAtATime) {
    add_script_provider("sleeper", "exec sleep 30");
    process::SupervisorConfig config;
    config.mode = process::ProcessMode::SINGLE;
    make_supervisor(config);

    auto first = start_ok(request("sleeper"));

    std::string error;
    EXPECT_FALSE(supervisor->start(request("sleeper"), error).has_value());
    EXPECT_EQ(error, "A process is already running");

    EXPECT_EQ(supervisor->stop(), 1u);
    ASSERT_TRUE(sink.wait_for_terminal(first));

    // The entry is removed before the terminal event is published
    auto second = start_ok(request("sleeper"));
    EXPECT_NE(first, second);
    supervisor->stop();
    ASSERT_TRUE(sink.wait_for_terminal(second));
}

TEST_F(ProcessSupervisorTest, ShutdownRejectsNewStartsAndReapsEverything) {
    add_script_provider("sleeper", "exec sleep 30");
    make_supervisor();

    auto id = start_ok(request("sleeper"));
    supervisor->shutdown();

    expect_single_terminal(id);
    std::string error;
    EXPECT_FALSE(supervisor->start(request("sleeper"), error).has_value());
    EXPECT_EQ(error, "Supervisor is shutting down");
}

TEST_F(ProcessSupervisorTest, DropPolicyLosesSplitCharacters) {
    // U+20AC written as three octal bytes, no newline
    add_script_provider("euro", "printf 'a\\342\\202\\254b'");
    process::SupervisorConfig config;
    config.read_chunk_bytes = 1;
    config.utf8_policy = process::Utf8Policy::DROP;
    make_supervisor(config);

    auto id = start_ok(request("euro"));
    ASSERT_TRUE(sink.wait_for_terminal(id));
    EXPECT_EQ(sink.output_of(id), "ab");
}

TEST_F(ProcessSupervisorTest, BufferPolicyReassemblesSplitCharacters) {
    add_script_provider("euro", "printf 'a\\342\\202\\254b'");
    process::SupervisorConfig config;
    config.read_chunk_bytes = 1;
    config.utf8_policy = process::Utf8Policy::BUFFER;
    make_supervisor(config);

    auto id = start_ok(request("euro"));
    ASSERT_TRUE(sink.wait_for_terminal(id));
    EXPECT_EQ(sink.output_of(id), "a\xE2\x82\xAC" "b");
}
