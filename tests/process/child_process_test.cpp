#include <gtest/gtest.h>
#include "rpl/process/child_process.hpp"

#include <chrono>
#include <string>
#include <thread>

#include <csignal>
#include <unistd.h>

using namespace rpl;
using namespace rpl::process;

namespace {

std::string read_all(int fd) {
    std::string out;
    char buffer[256];
    ssize_t n = 0;
    while ((n = ::read(fd, buffer, sizeof(buffer))) > 0) {
        out.append(buffer, static_cast<std::size_t>(n));
    }
    return out;
}

} // namespace

TEST(ChildProcess, CapturesOutputAndExitCode) {
    auto child = ChildProcess::spawn({{"/bin/sh", "-c", "echo hello; echo oops >&2; exit 3"}});
    ASSERT_TRUE(child.is_ok()) << child.error().message;

    const auto output = read_all(child.value().stdout_fd());
    auto code = child.value().wait();

    ASSERT_TRUE(code.is_ok());
    EXPECT_EQ(code.value(), 3);
    EXPECT_NE(output.find("hello"), std::string::npos);
    EXPECT_NE(output.find("oops"), std::string::npos);
}

TEST(ChildProcess, PassesEnvironment) {
    LaunchOptions options;
    options.argv = {"/bin/sh", "-c", "printf '%s' \"$RPL_TEST_VALUE\""};
    options.env = {{"RPL_TEST_VALUE", "value-42"}};

    auto child = ChildProcess::spawn(options);
    ASSERT_TRUE(child.is_ok());

    EXPECT_EQ(read_all(child.value().stdout_fd()), "value-42");
    EXPECT_EQ(child.value().wait().value(), 0);
}

TEST(ChildProcess, MissingProgramIsSpawnError) {
    auto child = ChildProcess::spawn({{"rpl-no-such-program-xyz"}});

    ASSERT_TRUE(child.is_error());
    EXPECT_EQ(child.error().kind, ErrorKind::Io);
}

TEST(ChildProcess, TryWaitIsNonBlocking) {
    auto child = ChildProcess::spawn({{"/bin/sh", "-c", "sleep 5"}});
    ASSERT_TRUE(child.is_ok());

    EXPECT_FALSE(child.value().try_wait().has_value());
    EXPECT_FALSE(child.value().exited());

    auto code = child.value().terminate(std::chrono::milliseconds(2000));
    ASSERT_TRUE(code.is_ok());
    EXPECT_TRUE(child.value().exited());
}

TEST(ChildProcess, TerminateEscalatesToKill) {
    auto child = ChildProcess::spawn({{"/bin/sh", "-c", "trap '' TERM; while true; do sleep 1; done"}});
    ASSERT_TRUE(child.is_ok());
    // Give the shell time to install its trap
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    const auto start = std::chrono::steady_clock::now();
    auto code = child.value().terminate(std::chrono::milliseconds(300));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(code.is_ok());
    EXPECT_EQ(code.value(), 128 + SIGKILL);
    EXPECT_GE(elapsed, std::chrono::milliseconds(250));
}

TEST(ChildProcess, TerminateAfterExitReturnsExitCode) {
    auto child = ChildProcess::spawn({{"/bin/sh", "-c", "exit 7"}});
    ASSERT_TRUE(child.is_ok());
    ASSERT_EQ(child.value().wait().value(), 7);

    auto code = child.value().terminate(std::chrono::milliseconds(100));
    ASSERT_TRUE(code.is_ok());
    EXPECT_EQ(code.value(), 7);
}

TEST(ChildProcess, DecodeWaitStatus) {
    EXPECT_EQ(decode_wait_status(0), 0);
    EXPECT_EQ(decode_wait_status(2 << 8), 2);
    EXPECT_EQ(decode_wait_status(SIGTERM), 128 + SIGTERM);
}

TEST(ChildProcess, TerminateAfterExitIgnoresKillTimeout) {
    auto child = ChildProcess::spawn({{"/bin/sh", "-c", "exit 0"}});
    ASSERT_TRUE(child.is_ok());
    ASSERT_EQ(child.value().wait().value(), 0);

    // Already reaped: a zero kill timeout is never reached
    auto code = child.value().terminate(std::chrono::milliseconds(0), std::chrono::milliseconds(0));
    ASSERT_TRUE(code.is_ok());
    EXPECT_EQ(code.value(), 0);
}

TEST(ChildProcess, WaitForGivesUpAtDeadline) {
    auto child = ChildProcess::spawn({{"/bin/sh", "-c", "sleep 30"}});
    ASSERT_TRUE(child.is_ok());

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(child.value().wait_for(std::chrono::milliseconds(100)).has_value());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(100));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_FALSE(child.value().exited());
}

TEST(ChildProcess, SignalAfterExitIsNotAnError) {
    auto child = ChildProcess::spawn({{"/bin/sh", "-c", "exit 0"}});
    ASSERT_TRUE(child.is_ok());
    ASSERT_EQ(child.value().wait().value(), 0);

    EXPECT_TRUE(child.value().signal(SIGTERM).is_ok());
}

TEST(ChildProcess, DestroyingRunningChildDoesNotWait) {
    pid_t pid = -1;
    const auto start = std::chrono::steady_clock::now();
    {
        auto child = ChildProcess::spawn({{"/bin/sh", "-c", "trap '' TERM; sleep 30"}});
        ASSERT_TRUE(child.is_ok());
        pid = child.value().pid();
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::seconds(2));
    // The child is gone (reaped), so the pid no longer names our process
    EXPECT_NE(::kill(pid, 0), 0);
}
