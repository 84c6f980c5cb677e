#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Project request ─────────────────────────────────────────

enum class CreateFlag { Venv, Install, RefreshTemplates, Force };

struct CreateFlags {
    bool create_venv = false;
    bool install_packages = false;
    bool refresh_templates = false;
    bool force = false;

    void set(CreateFlag flag, bool value) {
        switch (flag) {
            case CreateFlag::Venv:             create_venv = value; break;
            case CreateFlag::Install:          install_packages = value; break;
            case CreateFlag::RefreshTemplates: refresh_templates = value; break;
            case CreateFlag::Force:            force = value; break;
        }
    }

    bool get(CreateFlag flag) const {
        switch (flag) {
            case CreateFlag::Venv:             return create_venv;
            case CreateFlag::Install:          return install_packages;
            case CreateFlag::RefreshTemplates: return refresh_templates;
            case CreateFlag::Force:            return force;
        }
        return false;
    }
};

struct ProjectRequest {
    std::string name;                            // raw user input, validated separately
    CreateFlags flags;
};

struct ValidationResult {
    bool valid = false;
    std::string message;                         // empty when valid
};

// ── Capabilities ────────────────────────────────────────────

enum class Capability { Interpreter = 0, PackageInstaller = 1, VenvTool = 2 };
constexpr std::size_t CAPABILITY_COUNT = 3;

// One external command tried while probing a capability.
struct ProbeCandidate {
    std::string program;
    std::vector<std::string> args;
};

using ProbeChain = std::vector<ProbeCandidate>;

struct CapabilityStatus {
    enum class State { Checking, Available, Unavailable };

    State state = State::Checking;
    std::string reason;                          // remediation hint when Unavailable
    std::optional<ProbeCandidate> via;           // candidate that succeeded when Available

    static CapabilityStatus checking() {
        return {};
    }

    static CapabilityStatus available(ProbeCandidate candidate) {
        CapabilityStatus s;
        s.state = State::Available;
        s.via = std::move(candidate);
        return s;
    }

    static CapabilityStatus unavailable(const std::string& reason) {
        CapabilityStatus s;
        s.state = State::Unavailable;
        s.reason = reason;
        return s;
    }

    bool is_checking() const { return state == State::Checking; }
    bool is_available() const { return state == State::Available; }
};

// ── Log ─────────────────────────────────────────────────────

enum class LogKind { Status, Command, Stdout, Stderr, Exit, Error };

struct LogEntry {
    LogKind kind;
    std::string text;
    int exit_code = 0;                           // Exit entries only
};

// Result of one scaffolding run
struct RunOutcome {
    bool spawned = false;
    int exit_code = -1;                          // EXIT_CODE_UNKNOWN when not spawned or killed
    int term_signal = 0;

    bool success() const { return spawned && exit_code == 0; }
};
