#include "pty/pty_channel.hpp"

#include <gtest/gtest.h>
#include <sys/wait.h>

#include <chrono>
#include <csignal>
#include <string>

#include "test_helpers.hpp"

using namespace trellico::pty;
using trellico::tests::TempDir;
using trellico::tests::write_script;

namespace {

// Reads until END (or a generous deadline), returning everything seen
std::string drain(PtyChannel &channel, PtyChannel::ReadStatus &last) {
    std::string out;
    char buf[256];
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        auto result = channel.read(buf, sizeof(buf), 100);
        last = result.status;
        if (result.status == PtyChannel::ReadStatus::DATA) {
            out.append(buf, result.bytes);
        } else if (result.status != PtyChannel::ReadStatus::TIMEOUT) {
            break;
        }
    }
    return out;
}

}  // namespace

TEST(PtyChannelTest, ExitCodeFromStatus) {
    EXPECT_EQ(exit_code_from_status(0), 0);
    EXPECT_EQ(exit_code_from_status(3 << 8), 3);       // WIFEXITED, status 3
    EXPECT_EQ(exit_code_from_status(SIGKILL), 128 + SIGKILL);
}

TEST(PtyChannelTest, StreamsOutputAndReapsExitCode) {
    TempDir dir;
    auto script = write_script(dir.path() / "echo.sh", "echo \"out:$1\"\nexit 5");

    PtyChannel channel;
    std::string error;
    ASSERT_TRUE(channel.open(24, 80, error)) << error;
    ASSERT_TRUE(channel.spawn(script, {"arg"}, dir.str(), error)) << error;
    EXPECT_TRUE(channel.has_child());

    PtyChannel::ReadStatus last = PtyChannel::ReadStatus::TIMEOUT;
    std::string out = drain(channel, last);
    EXPECT_EQ(last, PtyChannel::ReadStatus::END);
    EXPECT_NE(out.find("out:arg"), std::string::npos) << out;

    auto code = channel.wait(error);
    ASSERT_TRUE(code.has_value()) << error;
    EXPECT_EQ(*code, 5);
    EXPECT_FALSE(channel.is_open());
}

TEST(PtyChannelTest, ChildRunsInRequestedDirectoryWithTerminal) {
    TempDir dir;
    auto script = write_script(dir.path() / "where.sh", "pwd\nif [ -t 1 ]; then echo tty; fi");

    PtyChannel channel;
    std::string error;
    ASSERT_TRUE(channel.open(24, 80, error)) << error;
    ASSERT_TRUE(channel.spawn(script, {}, dir.str(), error)) << error;

    PtyChannel::ReadStatus last;
    std::string out = drain(channel, last);
    EXPECT_NE(out.find(dir.path().filename().string()), std::string::npos) << out;
    EXPECT_NE(out.find("tty"), std::string::npos) << out;
    channel.wait(error);
}

TEST(PtyChannelTest, MissingWorkingDirectoryExits127) {
    TempDir dir;
    auto script = write_script(dir.path() / "noop.sh", "exit 0");

    PtyChannel channel;
    std::string error;
    ASSERT_TRUE(channel.open(24, 80, error)) << error;
    ASSERT_TRUE(channel.spawn(script, {}, (dir.path() / "missing").string(), error)) << error;

    PtyChannel::ReadStatus last;
    drain(channel, last);
    auto code = channel.wait(error);
    ASSERT_TRUE(code.has_value()) << error;
    EXPECT_EQ(*code, 127);
}

TEST(PtyChannelTest, KillTerminatesSilentChild) {
    TempDir dir;
    auto script = write_script(dir.path() / "sleep.sh", "exec sleep 30");

    PtyChannel channel;
    std::string error;
    ASSERT_TRUE(channel.open(24, 80, error)) << error;
    ASSERT_TRUE(channel.spawn(script, {}, dir.str(), error)) << error;

    char buf[64];
    auto result = channel.read(buf, sizeof(buf), 100);
    EXPECT_EQ(result.status, PtyChannel::ReadStatus::TIMEOUT);

    const auto start = std::chrono::steady_clock::now();
    channel.kill();
    auto code = channel.wait(error);
    ASSERT_TRUE(code.has_value()) << error;
    EXPECT_EQ(*code, 128 + SIGKILL);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(PtyChannelTest, OtherChildrenDoNotHoldTheTerminal) {
    TempDir dir;
    auto sleeper = write_script(dir.path() / "sleep.sh", "exec sleep 30");
    auto quick = write_script(dir.path() / "quick.sh", "echo done");

    // first's pair exists while second forks; second's child must not inherit it
    PtyChannel first;
    PtyChannel second;
    std::string error;
    ASSERT_TRUE(first.open(24, 80, error)) << error;
    ASSERT_TRUE(second.open(24, 80, error)) << error;
    ASSERT_TRUE(second.spawn(sleeper, {}, dir.str(), error)) << error;
    ASSERT_TRUE(first.spawn(quick, {}, dir.str(), error)) << error;

    const auto start = std::chrono::steady_clock::now();
    PtyChannel::ReadStatus last = PtyChannel::ReadStatus::TIMEOUT;
    std::string out = drain(first, last);
    EXPECT_EQ(last, PtyChannel::ReadStatus::END) << out;
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
    EXPECT_NE(out.find("done"), std::string::npos) << out;

    auto code = first.wait(error);
    ASSERT_TRUE(code.has_value()) << error;
    EXPECT_EQ(*code, 0);

    second.kill();
    second.wait(error);
}

TEST(PtyChannelTest, SpawnWithoutOpenFails) {
    PtyChannel channel;
    std::string error;
    EXPECT_FALSE(channel.spawn("/bin/true", {}, "/", error));
    EXPECT_FALSE(error.empty());
}
