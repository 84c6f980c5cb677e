#include "status_view.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

std::string render_entry(const LogEntry& entry) {
    switch (entry.kind) {
        case LogKind::Command: return theme::step(entry.text);
        case LogKind::Stdout:  return theme::output(entry.text);
        case LogKind::Stderr:  return theme::output(theme::yellow(entry.text));
        case LogKind::Error:   return theme::fail(entry.text);
        case LogKind::Status:  return theme::info(entry.text);
        case LogKind::Exit:    break;
    }
    return entry.exit_code == 0 ? theme::ok(entry.text) : theme::fail(entry.text);
}

std::string render_capability(Capability cap, const CapabilityStatus& status) {
    std::string value;
    switch (status.state) {
        case CapabilityStatus::State::Checking:
            value = theme::dim("checking...");
            break;
        case CapabilityStatus::State::Available:
            value = theme::green("available");
            if (status.via) {
                value += theme::dim(" (" + join_command_line(status.via->program, status.via->args) + ")");
            }
            break;
        case CapabilityStatus::State::Unavailable:
            value = theme::red("not found") + theme::dim(" - " + status.reason);
            break;
    }
    return theme::kv(capability_label(cap), value);
}

std::string render_status(const Orchestrator& orch) {
    std::string out;
    const auto& req = orch.request();

    out += theme::section("Project");
    out += theme::kv("Name", req.name.empty() ? theme::dim("(not set)") : req.name);
    if (!req.name.empty() || !orch.validation().valid) {
        out += theme::kv("Valid", orch.validation().valid
                                      ? theme::green("yes")
                                      : theme::red(orch.validation().message));
    }
    std::string flags;
    for (CreateFlag f : ALL_FLAGS) {
        std::string piece = std::string(flag_name(f)) + (orch.flag(f) ? " on" : " off");
        if (!flags.empty()) flags += "  ";
        flags += orch.flag(f) ? theme::teal(piece) : theme::dim(piece);
    }
    out += theme::kv("Flags", flags);
    out += theme::kv("Script", orch.config().script_path().string());

    std::string sources;
    for (const auto& path : orch.config().sources()) {
        if (!sources.empty()) sources += ", ";
        sources += path.string();
    }
    out += theme::kv("Config", sources.empty() ? theme::dim("built-in defaults") : sources);

    out += theme::section("Environment");
    for (Capability cap : ALL_CAPABILITIES) {
        out += render_capability(cap, orch.capability(cap));
    }

    out += theme::section("Create");
    if (orch.busy()) {
        out += theme::kv("State", theme::yellow("running"));
    } else if (orch.can_create()) {
        out += theme::kv("State", theme::green("ready"));
        out += theme::kv("Command", join_command_line(orch.scaffold_program(), orch.scaffold_args()));
    } else {
        out += theme::kv("State", theme::dim("not ready"));
    }
    if (orch.last_outcome()) {
        out += theme::kv("Last run", format_exit_line(*orch.last_outcome()));
    }
    return out;
}

std::string render_run_result(const RunOutcome& outcome) {
    if (!outcome.spawned) {
        return theme::fail("The scaffolding script could not be started.");
    }
    if (outcome.success()) {
        return theme::ok("Project created.");
    }
    if (outcome.term_signal != 0) {
        return theme::fail(fmt::format("Script was terminated by signal {}.", outcome.term_signal));
    }
    return theme::fail(fmt::format("Script failed with exit code {}.", outcome.exit_code));
}

std::optional<CreateFlag> parse_flag_name(const std::string& name) {
    std::string n = name;
    if (n.rfind("--", 0) == 0) n = n.substr(2);
    if (n == "venv")                                return CreateFlag::Venv;
    if (n == "install")                             return CreateFlag::Install;
    if (n == "refresh" || n == "refresh-templates") return CreateFlag::RefreshTemplates;
    if (n == "force")                               return CreateFlag::Force;
    return std::nullopt;
}

const char* flag_name(CreateFlag flag) {
    switch (flag) {
        case CreateFlag::Venv:             return "venv";
        case CreateFlag::Install:          return "install";
        case CreateFlag::RefreshTemplates: return "refresh";
        case CreateFlag::Force:            return "force";
    }
    return "?";
}
