#include "mkproj_cli.hpp"
#include "status_view.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <unistd.h>
#include <core/config.hpp>
#include <core/debug_log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <readline/readline.h>
#include <readline/history.h>

// Bits of platform::wait_readable() for {stdin, wake-up fd}
static constexpr int INPUT_READY = 1 << 0;
static constexpr int EVENTS_READY = 1 << 1;

// readline's callback API takes a plain function pointer
static MkprojCLI* g_active_cli = nullptr;

static void on_readline_line(char* raw) {
    if (g_active_cli) g_active_cli->handle_line(raw);
}

MkprojCLI::MkprojCLI() : BaseCLI(), notifier_(config.notify()) {
    register_all_commands();
}

void MkprojCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        cli.request_quit();
    }, "Exit mkproj");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        cli.request_quit();
    }, "Exit mkproj");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_project_commands(*this);
    register_environment_commands(*this);
    register_log_commands(*this);
}

// ── Update rendering ─────────────────────────────────────────

std::string MkprojCLI::collect_updates() {
    std::string out;
    if (!orchestrator) return out;

    // create() raises busy synchronously; a fast run may also finish in
    // the batch processed below
    bool was_busy = shown_busy_ || orchestrator->busy();
    orchestrator->process_events();

    for (Capability cap : ALL_CAPABILITIES) {
        const auto& now = orchestrator->capability(cap);
        auto& shown = shown_caps_[capability_index(cap)];
        if (now.state != shown.state) {
            if (!now.is_checking()) {
                out += render_capability(cap, now);
            }
            shown = now;
        }
    }

    const auto& log = orchestrator->log();
    for (; printed_log_ < log.size(); printed_log_++) {
        out += render_entry(log[printed_log_]);
    }

    if (was_busy && !orchestrator->busy() && orchestrator->last_outcome()) {
        const RunOutcome& outcome = *orchestrator->last_outcome();
        out += render_run_result(outcome);
        out += notifier_.run_finished(orchestrator->run_request().name, outcome);
    }
    shown_busy_ = orchestrator->busy();
    notifier_.reap();

    return out;
}

void MkprojCLI::refresh_prompt() {
    prompt_ = get_prompt_string();
    rl_set_prompt(prompt_.c_str());
}

void MkprojCLI::print_above_prompt(const std::string& text) {
    char* saved_line = rl_copy_text(0, rl_end);
    int saved_point = rl_point;

    rl_save_prompt();
    rl_replace_line("", 0);
    rl_redisplay();

    std::cout << "\r\033[K" << text << std::flush;

    rl_restore_prompt();
    refresh_prompt();
    rl_replace_line(saved_line, 0);
    rl_point = saved_point;
    rl_forced_update_display();
    free(saved_line);
}

// ── REPL ─────────────────────────────────────────────────────

void MkprojCLI::handle_line(char* raw) {
    if (!raw) {
        // EOF / Ctrl-D
        std::cout << "\n";
        request_quit();
        return;
    }

    std::string line = raw;
    free(raw);

    std::string trimmed = line;
    trim(trimmed);
    if (!trimmed.empty()) {
        add_history(line.c_str());

        std::istringstream iss(trimmed);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        trim(args);

        execute_command(command, args);

        // Anything the command caused (e.g. a refused create) shows now
        std::cout << collect_updates() << std::flush;
    }

    if (quit_requested() && orchestrator && orchestrator->busy() && !quit_notice_shown_) {
        std::cout << theme::info("Waiting for the running script to finish before exiting...");
        quit_notice_shown_ = true;
    }
    refresh_prompt();
}

void MkprojCLI::run_repl() {
    std::cout << theme::banner();
    if (!config_error.empty()) {
        std::cout << theme::fail("Config: " + config_error);
        std::cout << theme::step("Continuing with built-in defaults.");
    }

    init_orchestrator();

    std::cout << theme::section("Environment");
    std::cout << theme::info("Checking for Python, pip and venv in the background...");
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    g_active_cli = this;
    prompt_ = get_prompt_string();
    rl_callback_handler_install(prompt_.c_str(), on_readline_line);

    while (!(quit_requested() && !orchestrator->busy())) {
        // After quit only the wake-up fd is watched; stdin at EOF would
        // otherwise be ready on every pass.
        int input_fd = quit_requested() ? -1 : STDIN_FILENO;
        int ready = platform::wait_readable({input_fd, orchestrator->wakeup_fd()}, -1);
        if (ready < 0) {
            mkproj_log("repl: poll failed: " + platform::errno_message(errno) + ", leaving");
            break;
        }

        if (ready & EVENTS_READY) {
            std::string text = collect_updates();
            if (!text.empty()) {
                print_above_prompt(text);
            } else {
                refresh_prompt();
                rl_forced_update_display();
            }
        }

        if (!quit_requested() && (ready & INPUT_READY)) {
            rl_callback_read_char();
        }
    }

    rl_callback_handler_remove();
    g_active_cli = nullptr;

    // Final events (exit line of a run that ended while quitting)
    std::cout << collect_updates() << std::flush;
    orchestrator.reset();
}

// ── Non-interactive modes ────────────────────────────────────

int MkprojCLI::run_check() {
    init_orchestrator();

    std::cout << theme::section("Environment");
    orchestrator->pump_until([this] { return !orchestrator->probing(); });

    bool ready = true;
    for (Capability cap : ALL_CAPABILITIES) {
        const auto& status = orchestrator->capability(cap);
        std::cout << render_capability(cap, status);
        if (!status.is_available()) ready = false;
    }
    std::cout << "\n";

    if (!ready) {
        std::cout << theme::step("Install the missing tools, then run 'mkproj check' again.");
        return 1;
    }
    std::cout << theme::ok("Environment ready.");
    return 0;
}

int MkprojCLI::run_create(const std::string& name, const CreateFlags& flags) {
    if (!config_error.empty()) {
        std::cout << theme::fail("Config: " + config_error);
        return 1;
    }

    init_orchestrator();
    orchestrator->set_name(name);
    for (CreateFlag flag : ALL_FLAGS) {
        orchestrator->set_flag(flag, flags.get(flag));
    }

    if (!orchestrator->validation().valid) {
        std::cout << theme::fail(orchestrator->validation().message);
        return 1;
    }

    std::cout << theme::section("Environment");
    orchestrator->pump_until([this] { return !orchestrator->probing(); });
    std::cout << collect_updates();

    std::cout << theme::section("Create " + name);
    auto started = orchestrator->create();
    if (started.is_err()) {
        std::cout << theme::fail(started.error);
        return 1;
    }

    while (orchestrator->busy()) {
        orchestrator->wait_for_events(-1);
        std::cout << collect_updates() << std::flush;
    }
    std::cout << collect_updates() << "\n";

    const auto& outcome = orchestrator->last_outcome();
    if (!outcome || !outcome->spawned) return 1;
    if (outcome->exit_code < 0) return 1;
    return outcome->exit_code;
}

int MkprojCLI::run_init() {
    fs::path path = get_global_config_path();
    bool existed = global_config_exists();

    auto r = create_default_global_config();
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }

    if (existed) {
        std::cout << theme::info("Config already exists at " + path.string());
    } else {
        std::cout << theme::ok("Wrote default config to " + path.string());
    }
    return 0;
}
