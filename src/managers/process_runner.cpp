#include "process_runner.hpp"
#include "line_channel.hpp"
#include <core/constants.hpp>
#include <core/debug_log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <unistd.h>
#include <cerrno>
#include <system_error>
#include <thread>

// Read fd until EOF, pushing one entry per line. A final unterminated
// line is pushed as-is; trailing '\r' is stripped.
static void drain_lines(int fd, LogKind kind, LineChannel& channel) {
    std::string partial;
    char buf[PROCESS_READ_BUF_SIZE];

    auto emit = [&](std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        channel.push(kind, std::move(line));
    };

    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;

        partial.append(buf, static_cast<std::size_t>(n));
        std::string::size_type start = 0;
        std::string::size_type nl;
        while ((nl = partial.find('\n', start)) != std::string::npos) {
            emit(partial.substr(start, nl - start));
            start = nl + 1;
        }
        partial.erase(0, start);
    }

    if (!partial.empty()) emit(std::move(partial));
    channel.close();
}

ProcessRunner::ProcessRunner(std::string workdir)
    : workdir_(std::move(workdir)) {}

RunOutcome ProcessRunner::run(const std::string& program,
                              const std::vector<std::string>& args,
                              const EntryCallback& on_entry) const {
    RunOutcome outcome;

    std::string cmdline = join_command_line(program, args);
    on_entry({LogKind::Command, "> " + cmdline});
    mkproj_log("runner: spawn " + cmdline + (workdir_.empty() ? "" : " (in " + workdir_ + ")"));

    auto spawned = platform::spawn(program, args, platform::OutputMode::Capture, workdir_);
    if (spawned.is_err()) {
        mkproj_log("runner: spawn failed: " + spawned.error);
        on_entry({LogKind::Error, "Failed to start: " + spawned.error});
        return outcome;
    }

    platform::ProcessHandle proc = std::move(spawned.value);
    outcome.spawned = true;

    // Both readers feed one channel; this thread is the only consumer and
    // therefore the only caller of on_entry.
    LineChannel channel(2);
    int exit_code = EXIT_CODE_UNKNOWN;
    std::thread out_reader, err_reader, waiter;
    try {
        out_reader = start_thread([&proc, &channel] {
            drain_lines(proc.stdout_fd(), LogKind::Stdout, channel);
        });
        err_reader = start_thread([&proc, &channel] {
            drain_lines(proc.stderr_fd(), LogKind::Stderr, channel);
        });
        waiter = start_thread([&proc, &exit_code] { exit_code = proc.wait(); });
    } catch (const std::system_error& e) {
        // Reaps the child; readers that did start then see EOF
        proc.terminate();
        if (out_reader.joinable()) out_reader.join();
        if (err_reader.joinable()) err_reader.join();

        outcome.spawned = false;
        mkproj_log(fmt::format("runner: pid {} abandoned, thread start failed: {}",
                               proc.native_handle(), e.what()));
        on_entry({LogKind::Error, std::string("Failed to start output readers: ") + e.what()});
        return outcome;
    }

    LogEntry entry;
    while (channel.pop(entry)) {
        on_entry(entry);
    }

    out_reader.join();
    err_reader.join();
    waiter.join();

    outcome.exit_code = exit_code;
    outcome.term_signal = proc.term_signal();
    mkproj_log(fmt::format("runner: pid {} finished: {}", proc.native_handle(), format_exit_line(outcome)));

    on_entry({LogKind::Exit, format_exit_line(outcome), outcome.exit_code});
    return outcome;
}

std::thread ProcessRunner::start_thread(std::function<void()> fn) const {
    return std::thread(std::move(fn));
}

std::vector<std::string> build_scaffold_args(const std::string& script_path,
                                             const ProjectRequest& request) {
    std::vector<std::string> args = {script_path, request.name};
    if (request.flags.force)             args.push_back(FLAG_FORCE);
    if (request.flags.create_venv)       args.push_back(FLAG_VENV);
    if (request.flags.install_packages)  args.push_back(FLAG_INSTALL);
    if (request.flags.refresh_templates) args.push_back(FLAG_REFRESH_TEMPLATES);
    return args;
}

std::string format_exit_line(const RunOutcome& outcome) {
    if (outcome.term_signal != 0) {
        return fmt::format("exit code {} (terminated by signal {})",
                           outcome.exit_code, outcome.term_signal);
    }
    return fmt::format("exit code {}", outcome.exit_code);
}
