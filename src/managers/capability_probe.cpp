#include "capability_probe.hpp"
#include <core/constants.hpp>
#include <core/debug_log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

// ── Launcher ────────────────────────────────────────────────

ProbeOutcome SystemCommandLauncher::launch(const ProbeCandidate& candidate) {
    auto spawned = platform::spawn(candidate.program, candidate.args,
                                   platform::OutputMode::Discard);
    if (spawned.is_err()) {
        mkproj_log("probe: launch failed: " + spawned.error);
        return ProbeOutcome::LaunchFailed;
    }

    platform::ProcessHandle proc = std::move(spawned.value);
    int code = proc.wait();
    return code == 0 ? ProbeOutcome::Succeeded : ProbeOutcome::ExitedNonZero;
}

// ── Names ───────────────────────────────────────────────────

const char* capability_name(Capability cap) {
    switch (cap) {
        case Capability::Interpreter:      return "interpreter";
        case Capability::PackageInstaller: return "package_installer";
        case Capability::VenvTool:         return "venv_tool";
    }
    return "unknown";
}

const char* capability_label(Capability cap) {
    switch (cap) {
        case Capability::Interpreter:      return "Python";
        case Capability::PackageInstaller: return "pip";
        case Capability::VenvTool:         return "venv";
    }
    return "?";
}

const char* capability_hint(Capability cap) {
    switch (cap) {
        case Capability::Interpreter:      return INTERPRETER_HINT;
        case Capability::PackageInstaller: return PACKAGE_INSTALLER_HINT;
        case Capability::VenvTool:         return VENV_TOOL_HINT;
    }
    return "";
}

const char* probe_outcome_name(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Succeeded:     return "ok";
        case ProbeOutcome::ExitedNonZero: return "non-zero exit";
        case ProbeOutcome::LaunchFailed:  return "not launched";
    }
    return "?";
}

// ── CapabilityProbe ─────────────────────────────────────────

CapabilityProbe::CapabilityProbe(CommandLauncher& launcher)
    : launcher_(launcher) {}

CapabilityStatus CapabilityProbe::probe_one(Capability cap, const ProbeChain& chain) const {
    for (const auto& candidate : chain) {
        ProbeOutcome outcome = launcher_.launch(candidate);
        mkproj_log(fmt::format("probe: {} candidate '{}' -> {}",
                               capability_name(cap),
                               join_command_line(candidate.program, candidate.args),
                               probe_outcome_name(outcome)));
        if (outcome == ProbeOutcome::Succeeded) {
            return CapabilityStatus::available(candidate);
        }
    }
    return CapabilityStatus::unavailable(capability_hint(cap));
}

CapabilitySet CapabilityProbe::probe_all(const ProbeSettings& probes) const {
    CapabilitySet result;
    for (Capability cap : ALL_CAPABILITIES) {
        result[capability_index(cap)] = probe_one(cap, probes.chain(cap));
    }
    return result;
}
