#include <gtest/gtest.h>
#include <platform/platform.hpp>
#include <unistd.h>

// Both ends of a pipe, closed on scope exit.
struct Pipe {
    int fds[2] = {-1, -1};
    Pipe() { EXPECT_EQ(pipe(fds), 0); }
    ~Pipe() {
        close_write();
        if (fds[0] >= 0) close(fds[0]);
    }
    void close_write() {
        if (fds[1] >= 0) close(fds[1]);
        fds[1] = -1;
    }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }
};

TEST(WaitReadable, TimesOutWhenNothingIsReady) {
    Pipe p;
    EXPECT_EQ(platform::wait_readable({p.read_end()}, 50), 0);
}

TEST(WaitReadable, ReportsEachReadyDescriptor) {
    Pipe input, events;
    ASSERT_EQ(write(events.write_end(), "x", 1), 1);
    EXPECT_EQ(platform::wait_readable({input.read_end(), events.read_end()}, 1000), 1 << 1);

    ASSERT_EQ(write(input.write_end(), "y", 1), 1);
    EXPECT_EQ(platform::wait_readable({input.read_end(), events.read_end()}, 1000), (1 << 0) | (1 << 1));
}

TEST(WaitReadable, EndOfFileCountsAsReady) {
    Pipe input, events;
    input.close_write();
    EXPECT_EQ(platform::wait_readable({input.read_end(), events.read_end()}, 1000), 1 << 0);
}

// A closed stdin must not wake a loop that stopped reading it.
TEST(WaitReadable, SkippedDescriptorIsIgnored) {
    Pipe input, events;
    input.close_write();
    EXPECT_EQ(platform::wait_readable({-1, events.read_end()}, 100), 0);

    ASSERT_EQ(write(events.write_end(), "x", 1), 1);
    EXPECT_EQ(platform::wait_readable({-1, events.read_end()}, 1000), 1 << 1);
}
