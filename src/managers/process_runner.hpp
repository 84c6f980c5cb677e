#pragma once

#include <functional>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>

// Runs one external command to completion, turning everything it prints into
// log entries.
//
// Entry order for a run that starts:
//   Command   echoed command line (emitted before launch)
//   Stdout/Stderr lines, each stream in its own order, interleaved by arrival
//   Exit      "exit code N" once the child exited and both pipes hit EOF
//
// A run that cannot start produces Command followed by a single Error entry
// and no Exit entry. The same holds when the child starts but its helper
// threads cannot; the child is then terminated and reaped, and the outcome
// counts as not spawned. run() never
// throws for child-side or thread-start failures.
class ProcessRunner {
public:
    using EntryCallback = std::function<void(const LogEntry&)>;

    explicit ProcessRunner(std::string workdir = "");
    virtual ~ProcessRunner() = default;

    // Blocks the calling thread until the run is complete. on_entry is
    // invoked from the calling thread only.
    RunOutcome run(const std::string& program,
                   const std::vector<std::string>& args,
                   const EntryCallback& on_entry) const;

protected:
    // Every helper thread of a run starts here. Throws std::system_error
    // when the thread cannot be created.
    virtual std::thread start_thread(std::function<void()> fn) const;

private:
    std::string workdir_;
};

// [script_path, project_name, --force?, --venv?, --install?, --refresh-templates?]
// Flag order is fixed so logs are reproducible.
std::vector<std::string> build_scaffold_args(const std::string& script_path,
                                             const ProjectRequest& request);

// "exit code 0", "exit code -1 (terminated by signal 9)"
std::string format_exit_line(const RunOutcome& outcome);
