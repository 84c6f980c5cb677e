#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <platform/platform.hpp>
#include <core/constants.hpp>
#include <unistd.h>
#include <csignal>
#include <string>

using platform::spawn;
using platform::OutputMode;

static std::string read_all(int fd) {
    std::string out;
    char buf[256];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<std::size_t>(n));
    }
    return out;
}

TEST(Process, CapturesStdoutAndStderrSeparately) {
    auto r = spawn("/bin/sh", {"-c", "echo out; echo err >&2; exit 3"});
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto proc = std::move(r.value);
    ASSERT_TRUE(proc.valid());
    EXPECT_EQ(read_all(proc.stdout_fd()), "out\n");
    EXPECT_EQ(read_all(proc.stderr_fd()), "err\n");
    EXPECT_EQ(proc.wait(), 3);
    EXPECT_EQ(proc.term_signal(), 0);
}

TEST(Process, WaitIsRepeatable) {
    auto r = spawn("/bin/sh", {"-c", "exit 0"}, OutputMode::Discard);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.wait(), 0);
    EXPECT_EQ(r.value.wait(), 0);
}

TEST(Process, DiscardModeHasNoPipes) {
    auto r = spawn("/bin/sh", {"-c", "echo hidden"}, OutputMode::Discard);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_fd(), -1);
    EXPECT_EQ(r.value.stderr_fd(), -1);
    EXPECT_EQ(r.value.wait(), 0);
}

TEST(Process, StdinIsEmpty) {
    // cat would block forever on an inherited terminal
    auto r = spawn("cat", {});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_all(r.value.stdout_fd()), "");
    EXPECT_EQ(r.value.wait(), 0);
}

TEST(Process, MissingProgramIsAnError) {
    auto r = spawn("mkproj-definitely-not-a-program", {"--version"});
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("mkproj-definitely-not-a-program"), std::string::npos);
}

TEST(Process, BadWorkdirIsAnError) {
    auto r = spawn("/bin/sh", {"-c", "exit 0"}, OutputMode::Discard, "/nonexistent/mkproj/dir");
    EXPECT_TRUE(r.is_err());
}

TEST(Process, RunsInWorkdir) {
    auto r = spawn("pwd", {}, OutputMode::Capture, "/");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_all(r.value.stdout_fd()), "/\n");
    EXPECT_EQ(r.value.wait(), 0);
}

TEST(Process, KilledBySignal) {
    auto r = spawn("/bin/sh", {"-c", "kill -TERM $$"}, OutputMode::Discard);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.wait(), EXIT_CODE_UNKNOWN);
    EXPECT_EQ(r.value.term_signal(), SIGTERM);
}

TEST(Process, MovedFromHandleIsInvalid) {
    auto r = spawn("/bin/sh", {"-c", "exit 0"}, OutputMode::Discard);
    ASSERT_TRUE(r.is_ok()) << r.error;
    platform::ProcessHandle a = std::move(r.value);
    EXPECT_FALSE(r.value.valid());
    EXPECT_TRUE(a.valid());
    EXPECT_EQ(a.wait(), 0);
}

TEST(Process, RunningUntilReaped) {
    auto r = spawn("/bin/sh", {"-c", "exit 5"}, OutputMode::Discard);
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto proc = std::move(r.value);

    for (int i = 0; i < 200 && proc.running(); i++) {
        platform::sleep_ms(10);
    }
    EXPECT_FALSE(proc.running());
    EXPECT_EQ(proc.wait(), 5);
}

TEST(Process, TerminateStopsChild) {
    auto r = spawn("/bin/sh", {"-c", "exec sleep 30"}, OutputMode::Discard);
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto proc = std::move(r.value);
    EXPECT_TRUE(proc.running());

    proc.terminate();
    EXPECT_FALSE(proc.running());
    EXPECT_EQ(proc.wait(), EXIT_CODE_UNKNOWN);
    EXPECT_EQ(proc.term_signal(), SIGTERM);

    // Already reaped
    proc.terminate();
    EXPECT_EQ(proc.term_signal(), SIGTERM);
}
