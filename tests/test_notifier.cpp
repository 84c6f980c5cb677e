#include <gtest/gtest.h>
#include <cli/notifier.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <chrono>
#include <fstream>
#include <memory>

static constexpr int TIMEOUT_MS = 10000;

static RunOutcome finished(int exit_code) {
    RunOutcome o;
    o.spawned = true;
    o.exit_code = exit_code;
    return o;
}

class NotifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("mkproj_notify_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        // Stand-in for notify-send: one argument per line
        script_ = dir_ / "fake-notify";
        {
            std::ofstream f(script_);
            f << "#!/bin/sh\nprintf '%s\\n' \"$@\" > '" << (dir_ / "args").string() << "'\n";
        }
        fs::permissions(script_, fs::perms::owner_all);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    NotifySettings settings(bool enabled, const std::string& program) {
        NotifySettings s;
        s.enabled = enabled;
        s.program = program;
        return s;
    }

    static bool drain(Notifier& notifier) {
        for (int waited = 0; waited < TIMEOUT_MS; waited += 10) {
            notifier.reap();
            if (notifier.pending() == 0) return true;
            platform::sleep_ms(10);
        }
        return false;
    }

    std::vector<std::string> recorded_args() {
        std::ifstream f(dir_ / "args");
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(f, line)) lines.push_back(line);
        return lines;
    }

    fs::path dir_;
    fs::path script_;
};

TEST(DescribeRun, Success) {
    Notification n = describe_run("demo", finished(0));
    EXPECT_EQ(n.summary, "Project created");
    EXPECT_EQ(n.body, "Project 'demo' has been created successfully!");
}

TEST(DescribeRun, Failure) {
    Notification n = describe_run("demo", finished(3));
    EXPECT_EQ(n.summary, "Project creation failed");
    EXPECT_EQ(n.body, "Failed to create project 'demo' (exit code 3).");

    Notification never = describe_run("demo", RunOutcome{});
    EXPECT_EQ(never.summary, "Project creation failed");
    EXPECT_NE(never.body.find("could not be started"), std::string::npos);
}

TEST_F(NotifierTest, RingsBellAndRunsNotifier) {
    Notifier notifier(settings(true, script_.string()));
    EXPECT_EQ(notifier.run_finished("demo", finished(0)), "\a");
    ASSERT_TRUE(drain(notifier));

    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "--app-name", NOTIFY_APP_NAME, "Project created",
        "Project 'demo' has been created successfully!"}));
}

TEST_F(NotifierTest, FailedRunIsReported) {
    Notifier notifier(settings(true, script_.string()));
    notifier.run_finished("demo", finished(2));
    ASSERT_TRUE(drain(notifier));

    auto args = recorded_args();
    ASSERT_EQ(args.size(), 4u);
    EXPECT_EQ(args[2], "Project creation failed");
    EXPECT_EQ(args[3], "Failed to create project 'demo' (exit code 2).");
}

TEST_F(NotifierTest, DisabledDoesNothing) {
    Notifier notifier(settings(false, script_.string()));
    EXPECT_EQ(notifier.run_finished("demo", finished(0)), "");
    EXPECT_EQ(notifier.pending(), 0u);
    platform::sleep_ms(100);
    EXPECT_FALSE(fs::exists(dir_ / "args"));
}

TEST_F(NotifierTest, MissingNotifierStillRingsBell) {
    Notifier notifier(settings(true, "mkproj-no-such-notifier"));
    EXPECT_EQ(notifier.run_finished("demo", finished(0)), "\a");
    EXPECT_EQ(notifier.pending(), 0u);
}

TEST_F(NotifierTest, SlowNotifierIsStoppedOnDestruction) {
    {
        std::ofstream f(script_);
        f << "#!/bin/sh\nexec sleep 30\n";
    }
    auto notifier = std::make_unique<Notifier>(settings(true, script_.string()));
    notifier->run_finished("demo", finished(0));
    EXPECT_EQ(notifier->pending(), 1u);

    auto begin = std::chrono::steady_clock::now();
    notifier.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
}
