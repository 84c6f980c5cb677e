#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <csignal>
#include <fcntl.h>
#include <cerrno>
#include <fmt/format.h>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipes();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    stdout_fd_ = other.stdout_fd_;
    stderr_fd_ = other.stderr_fd_;
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    term_signal_ = other.term_signal_;
    other.pid_ = -1;
    other.stdout_fd_ = -1;
    other.stderr_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipes();
        pid_ = other.pid_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        term_signal_ = other.term_signal_;
        other.pid_ = -1;
        other.stdout_fd_ = -1;
        other.stderr_fd_ = -1;
    }
    return *this;
}

void ProcessHandle::close_pipes() {
    if (stdout_fd_ >= 0) { close(stdout_fd_); stdout_fd_ = -1; }
    if (stderr_fd_ >= 0) { close(stderr_fd_); stderr_fd_ = -1; }
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return EXIT_CODE_UNKNOWN;
    if (reaped_) return exit_code_;

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        reaped_ = true;
        exit_code_ = EXIT_CODE_UNKNOWN;
    } else {
        record_status(status);
    }
    return exit_code_;
}

void ProcessHandle::record_status(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else {
        exit_code_ = EXIT_CODE_UNKNOWN;
        if (WIFSIGNALED(status)) term_signal_ = WTERMSIG(status);
    }
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == 0) return true;  // 0 means still running
    if (ret < 0) {
        reaped_ = true;
        exit_code_ = EXIT_CODE_UNKNOWN;
    } else {
        record_status(status);
    }
    return false;
}

void ProcessHandle::terminate() {
    if (!running()) return;
    kill(pid_, SIGTERM);
    // Wait for a graceful exit before forcing it
    for (int waited = 0; waited < TERMINATE_GRACE_MS; waited += TERMINATE_POLL_MS) {
        if (!running()) return;
        sleep_ms(TERMINATE_POLL_MS);
    }
    kill(pid_, SIGKILL);
    wait();
}

// ── spawn ────────────────────────────────────────────────────

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

// Child side only: report errno through the status pipe and exit.
[[noreturn]] static void child_fail(int status_fd, int err) {
    ssize_t n = write(status_fd, &err, sizeof(err));
    (void)n;
    _exit(EXEC_FAILED_EXIT_CODE);
}

Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            OutputMode mode,
                            const std::string& workdir) {
    if (program.empty()) {
        return Result<ProcessHandle>::Err("no program given");
    }

    // Build argv before fork; the child must not allocate.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    // status_pipe is close-on-exec: EOF without data means execvp succeeded.
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        return Result<ProcessHandle>::Err("pipe: " + errno_message(errno));
    }
    if (mode == OutputMode::Capture) {
        if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
            int err = errno;
            close_pair(out_pipe);
            close_pair(err_pipe);
            close_pair(status_pipe);
            return Result<ProcessHandle>::Err("pipe: " + errno_message(err));
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return Result<ProcessHandle>::Err("fork: " + errno_message(err));
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDWR);
        if (devnull < 0) child_fail(status_pipe[1], errno);
        if (dup2(devnull, STDIN_FILENO) < 0) child_fail(status_pipe[1], errno);

        if (mode == OutputMode::Capture) {
            if (dup2(out_pipe[1], STDOUT_FILENO) < 0) child_fail(status_pipe[1], errno);
            if (dup2(err_pipe[1], STDERR_FILENO) < 0) child_fail(status_pipe[1], errno);
        } else {
            if (dup2(devnull, STDOUT_FILENO) < 0) child_fail(status_pipe[1], errno);
            if (dup2(devnull, STDERR_FILENO) < 0) child_fail(status_pipe[1], errno);
        }
        if (devnull > STDERR_FILENO) close(devnull);

        if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
            child_fail(status_pipe[1], errno);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        child_fail(status_pipe[1], errno);
    }

    // Parent
    close(status_pipe[1]);
    if (mode == OutputMode::Capture) {
        close(out_pipe[1]);
        close(err_pipe[1]);
    }

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    ProcessHandle handle;
    handle.pid_ = pid;
    if (mode == OutputMode::Capture) {
        handle.stdout_fd_ = out_pipe[0];
        handle.stderr_fd_ = err_pipe[0];
    }

    if (n > 0) {
        // exec never happened: reap the child and report why
        handle.wait();
        std::string what = (!workdir.empty() && child_errno == ENOENT && access(workdir.c_str(), F_OK) != 0)
            ? fmt::format("working directory {}", workdir)
            : program;
        return Result<ProcessHandle>::Err(fmt::format("{}: {}", what, errno_message(child_errno)));
    }

    return Result<ProcessHandle>::Ok(std::move(handle));
}

} // namespace platform
