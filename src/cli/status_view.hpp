#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>
#include <managers/orchestrator.hpp>

// Text rendering of orchestrator state for the terminal. Pure functions of
// their inputs; nothing here prints.

// One log entry, coloured by kind, newline-terminated.
std::string render_entry(const LogEntry& entry);

// "Python      available (python3 --version)" and friends.
std::string render_capability(Capability cap, const CapabilityStatus& status);

// Full status panel: name, validation, flags, capabilities, gate.
std::string render_status(const Orchestrator& orch);

// One-line summary of a finished run.
std::string render_run_result(const RunOutcome& outcome);

// Flag names accepted by set/toggle and by `mkproj create` options. A
// leading "--" is optional, so the script's own flag spellings parse too.
std::optional<CreateFlag> parse_flag_name(const std::string& name);
const char* flag_name(CreateFlag flag);

constexpr CreateFlag ALL_FLAGS[] = {
    CreateFlag::Venv, CreateFlag::Install, CreateFlag::RefreshTemplates, CreateFlag::Force,
};
