#pragma once

#include <string>
#include <vector>

// Set by the build; fallback for tools that compile files on their own.
#ifndef MKPROJ_VERSION
#define MKPROJ_VERSION "0.1.0"
#endif

// ── Scaffolding invocation ──────────────────────────────────
constexpr const char* DEFAULT_SCRIPT        = "create_project.py";
constexpr const char* DEFAULT_INTERPRETER   = "python";
constexpr const char* INTERPRETER_AUTO      = "auto";   // use whichever interpreter probe succeeded

constexpr const char* FLAG_FORCE             = "--force";
constexpr const char* FLAG_VENV              = "--venv";
constexpr const char* FLAG_INSTALL           = "--install";
constexpr const char* FLAG_REFRESH_TEMPLATES = "--refresh-templates";

// ── Project names ───────────────────────────────────────────
constexpr int MAX_PROJECT_NAME_LEN = 64;

// ── Process handling ────────────────────────────────────────
constexpr int EXIT_CODE_UNKNOWN       = -1;    // no exit status (signal, never spawned)
constexpr int EXEC_FAILED_EXIT_CODE   = 127;   // child's _exit() when execvp fails
constexpr int PROCESS_READ_BUF_SIZE   = 4096;
constexpr int TERMINATE_GRACE_MS      = 2000;  // SIGTERM -> SIGKILL
constexpr int TERMINATE_POLL_MS       = 100;

// ── Completion notice ───────────────────────────────────────
constexpr const char* NOTIFY_PROGRAM  = "notify-send";
constexpr const char* NOTIFY_APP_NAME = "mkproj";
constexpr int NOTIFY_GRACE_MS         = 1000;  // wait for helpers at exit

// ── Probe candidate chains ──────────────────────────────────
// Each row is one candidate: program followed by its arguments. Rows are
// tried left to right and the first one that exits 0 wins. Overridable per
// capability from config.yaml (probes: section).
constexpr const char* VENV_IMPORT_PROBE = "import venv; print('ok')";

inline const std::vector<std::vector<std::string>> INTERPRETER_PROBES = {
    {"python", "--version"},
    {"python3", "--version"},
};

inline const std::vector<std::vector<std::string>> PACKAGE_INSTALLER_PROBES = {
    {"pip", "--version"},
    {"python", "-m", "pip", "--version"},
    {"python3", "-m", "pip", "--version"},
};

inline const std::vector<std::vector<std::string>> VENV_TOOL_PROBES = {
    {"virtualenv", "--version"},
    {"python", "-m", "virtualenv", "--version"},
    {"python3", "-m", "virtualenv", "--version"},
    {"python", "-c", VENV_IMPORT_PROBE},
    {"python3", "-c", VENV_IMPORT_PROBE},
};

// ── Remediation hints ───────────────────────────────────────
constexpr const char* INTERPRETER_HINT       = "Python not found. Install Python and add it to PATH";
constexpr const char* PACKAGE_INSTALLER_HINT = "pip not found. Install pip (python -m ensurepip --upgrade)";
constexpr const char* VENV_TOOL_HINT         = "Neither virtualenv nor the built-in venv module is available. "
                                               "Install virtualenv or a Python that ships venv";

// ── Event loop ──────────────────────────────────────────────
constexpr int EVENT_WAIT_SLICE_MS = 100;   // wait granularity when pumping headless
