#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Where a child's stdout/stderr go.
enum class OutputMode {
    Capture,   // each stream to its own pipe, read via stdout_fd()/stderr_fd()
    Discard,   // both streams to /dev/null
};

// Owning handle to a spawned child process. Closes any captured pipe ends on
// destruction; the child is reaped by wait().
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Block until the process exits. Returns its exit code, or
    // EXIT_CODE_UNKNOWN if it was killed by a signal (see term_signal()).
    // Safe to call again after the child has been reaped.
    int wait();

    // Non-blocking check; reaps the child if it has exited.
    bool running();

    // SIGTERM, then SIGKILL if the child is still alive after
    // TERMINATE_GRACE_MS. Reaps the child.
    void terminate();

    // Signal that terminated the child, 0 if it exited normally.
    int term_signal() const { return term_signal_; }

    // Read ends of the captured pipes; -1 in Discard mode.
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    int native_handle() const { return pid_; }

private:
    void close_pipes();
    void record_status(int status);

    int pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
    int term_signal_ = 0;

    friend Result<ProcessHandle> spawn(const std::string& program,
                                       const std::vector<std::string>& args,
                                       OutputMode mode,
                                       const std::string& workdir);
};

// Spawn a child process with stdin on /dev/null.
// program is looked up on PATH. If workdir is non-empty the child runs there.
// Returns Err with a description when the program cannot be started (fork
// failure, missing executable, permission denied, bad workdir); a started
// process never produces Err.
Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            OutputMode mode = OutputMode::Capture,
                            const std::string& workdir = "");

} // namespace platform
