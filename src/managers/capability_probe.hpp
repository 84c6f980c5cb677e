#pragma once

#include <array>
#include <string>
#include <core/types.hpp>
#include <core/config.hpp>

// What happened when one probe candidate was run.
enum class ProbeOutcome {
    Succeeded,       // started and exited 0
    ExitedNonZero,   // started, exited non-zero or was killed
    LaunchFailed,    // could not be started (not on PATH, not executable)
};

// Runs a single probe candidate. Implementations must be callable from
// several threads at once: the orchestrator probes capabilities in parallel.
class CommandLauncher {
public:
    virtual ~CommandLauncher() = default;
    virtual ProbeOutcome launch(const ProbeCandidate& candidate) = 0;
};

// Spawns the candidate with output discarded and waits for it.
class SystemCommandLauncher : public CommandLauncher {
public:
    ProbeOutcome launch(const ProbeCandidate& candidate) override;
};

const char* capability_name(Capability cap);
const char* capability_label(Capability cap);   // short UI label: "Python", "pip", "venv"
const char* capability_hint(Capability cap);
const char* probe_outcome_name(ProbeOutcome outcome);

constexpr std::array<Capability, CAPABILITY_COUNT> ALL_CAPABILITIES = {
    Capability::Interpreter, Capability::PackageInstaller, Capability::VenvTool,
};

inline std::size_t capability_index(Capability cap) {
    return static_cast<std::size_t>(cap);
}

using CapabilitySet = std::array<CapabilityStatus, CAPABILITY_COUNT>;

// Evaluates candidate chains. Stateless apart from the launcher it borrows;
// supersession of stale probes is the caller's business.
class CapabilityProbe {
public:
    explicit CapabilityProbe(CommandLauncher& launcher);

    // Try candidates left to right, stop at the first success.
    CapabilityStatus probe_one(Capability cap, const ProbeChain& chain) const;

    // Probe all three capabilities sequentially.
    CapabilitySet probe_all(const ProbeSettings& probes) const;

private:
    CommandLauncher& launcher_;
};
