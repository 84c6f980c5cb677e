#pragma once

#include "base_cli.hpp"
#include "notifier.hpp"
#include <string>
#include <core/types.hpp>

// Forward declarations for command registration
void register_project_commands(BaseCLI& cli);
void register_environment_commands(BaseCLI& cli);
void register_log_commands(BaseCLI& cli);

class MkprojCLI : public BaseCLI {
public:
    MkprojCLI();

    // Interactive prompt. One thread: poll() waits on stdin and on the
    // orchestrator's wake-up fd; readline runs in callback mode so
    // background output can be printed without losing the typed line.
    void run_repl();

    // Probe and report. Returns 0 only if every tool is available.
    int run_check();

    // Headless create. Returns the script's exit code, or 1 when the run
    // is refused or the script cannot be started.
    int run_create(const std::string& name, const CreateFlags& flags);

    // Write ~/.mkproj/config.yaml with defaults if it does not exist.
    int run_init();

    // Called by the readline line handler.
    void handle_line(char* raw);

private:
    void register_all_commands();

    // Everything that changed since the last call, rendered: new log
    // entries, capability transitions, run completion. A finished run
    // also goes to the notifier.
    std::string collect_updates();

    // Print above the prompt, then redraw the prompt and partial input.
    void print_above_prompt(const std::string& text);

    void refresh_prompt();

    std::size_t printed_log_ = 0;
    CapabilitySet shown_caps_;
    bool shown_busy_ = false;
    bool quit_notice_shown_ = false;
    std::string prompt_;
    Notifier notifier_;
};
