#include <gtest/gtest.h>
#include <managers/capability_probe.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <map>
#include <mutex>
#include <string>

// Scripted launcher: outcome per program name, every call recorded.
class ScriptedLauncher : public CommandLauncher {
public:
    std::map<std::string, ProbeOutcome> outcomes;

    ProbeOutcome launch(const ProbeCandidate& candidate) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(candidate.program);
        auto it = outcomes.find(candidate.program);
        return it == outcomes.end() ? ProbeOutcome::LaunchFailed : it->second;
    }

    std::vector<std::string> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> calls_;
};

static ProbeChain chain_of(std::initializer_list<const char*> programs) {
    ProbeChain chain;
    for (const char* p : programs) chain.push_back({p, {"--version"}});
    return chain;
}

TEST(CapabilityProbe, FirstSuccessShortCircuits) {
    ScriptedLauncher launcher;
    launcher.outcomes["a"] = ProbeOutcome::Succeeded;
    launcher.outcomes["b"] = ProbeOutcome::Succeeded;
    CapabilityProbe probe(launcher);

    auto status = probe.probe_one(Capability::Interpreter, chain_of({"a", "b"}));
    EXPECT_TRUE(status.is_available());
    ASSERT_TRUE(status.via.has_value());
    EXPECT_EQ(status.via->program, "a");
    EXPECT_EQ(launcher.calls(), std::vector<std::string>{"a"});
}

TEST(CapabilityProbe, FallsThroughFailures) {
    ScriptedLauncher launcher;
    launcher.outcomes["pip"] = ProbeOutcome::LaunchFailed;
    launcher.outcomes["python"] = ProbeOutcome::ExitedNonZero;
    launcher.outcomes["python3"] = ProbeOutcome::Succeeded;
    CapabilityProbe probe(launcher);

    auto status = probe.probe_one(Capability::PackageInstaller, chain_of({"pip", "python", "python3"}));
    EXPECT_TRUE(status.is_available());
    EXPECT_EQ(status.via->program, "python3");
    EXPECT_EQ(launcher.calls(), (std::vector<std::string>{"pip", "python", "python3"}));
}

TEST(CapabilityProbe, AllFailGivesHint) {
    ScriptedLauncher launcher;
    CapabilityProbe probe(launcher);

    auto status = probe.probe_one(Capability::VenvTool, chain_of({"x", "y", "z"}));
    EXPECT_EQ(status.state, CapabilityStatus::State::Unavailable);
    EXPECT_EQ(status.reason, VENV_TOOL_HINT);
    EXPECT_FALSE(status.via.has_value());
    EXPECT_EQ(launcher.calls().size(), 3u);
}

TEST(CapabilityProbe, EmptyChainIsUnavailable) {
    ScriptedLauncher launcher;
    CapabilityProbe probe(launcher);

    auto status = probe.probe_one(Capability::Interpreter, {});
    EXPECT_EQ(status.state, CapabilityStatus::State::Unavailable);
    EXPECT_EQ(status.reason, INTERPRETER_HINT);
    EXPECT_TRUE(launcher.calls().empty());
}

TEST(CapabilityProbe, ProbeAllUsesEachChain) {
    ScriptedLauncher launcher;
    launcher.outcomes["python3"] = ProbeOutcome::Succeeded;
    CapabilityProbe probe(launcher);

    ProbeSettings settings;
    settings.interpreter = chain_of({"python", "python3"});
    settings.package_installer = chain_of({"pip"});
    settings.venv_tool = chain_of({"virtualenv"});

    auto set = probe.probe_all(settings);
    EXPECT_TRUE(set[capability_index(Capability::Interpreter)].is_available());
    EXPECT_EQ(set[capability_index(Capability::PackageInstaller)].reason, PACKAGE_INSTALLER_HINT);
    EXPECT_EQ(set[capability_index(Capability::VenvTool)].reason, VENV_TOOL_HINT);
}

TEST(SystemCommandLauncher, RealCommands) {
    SystemCommandLauncher launcher;
    EXPECT_EQ(launcher.launch({"/bin/sh", {"-c", "exit 0"}}), ProbeOutcome::Succeeded);
    EXPECT_EQ(launcher.launch({"/bin/sh", {"-c", "exit 1"}}), ProbeOutcome::ExitedNonZero);
    EXPECT_EQ(launcher.launch({"mkproj-no-such-tool", {"--version"}}), ProbeOutcome::LaunchFailed);
}

TEST(CapabilityNames, Labels) {
    EXPECT_STREQ(capability_label(Capability::Interpreter), "Python");
    EXPECT_STREQ(capability_label(Capability::PackageInstaller), "pip");
    EXPECT_STREQ(capability_label(Capability::VenvTool), "venv");
    EXPECT_STREQ(capability_name(Capability::VenvTool), "venv_tool");
}
