#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include "capability_probe.hpp"
#include "event_queue.hpp"
#include "process_runner.hpp"

// Owns everything the front end shows: the project request, validation, the
// three capability statuses, the busy flag and the run log.
//
// Threading: every public method must be called from one thread (the UI
// thread). Probes and runs execute on background threads and never touch
// this object's state directly; they post closures that process_events()
// applies. Hence no locks around the state itself.
//
// States are Idle (!busy) and Running (busy). can_create() is derived on
// every call from busy, validation and capabilities; it is never stored.
class Orchestrator {
public:
    // Starts probing immediately when probe_on_start is set. A null launcher
    // means SystemCommandLauncher.
    explicit Orchestrator(Config config,
                          std::unique_ptr<CommandLauncher> launcher = nullptr,
                          bool probe_on_start = true);

    // Joins every background thread. Blocks while a run is in flight.
    virtual ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Form ─────────────────────────────────────────────────
    void set_name(const std::string& name);
    void set_flag(CreateFlag flag, bool value);
    bool flag(CreateFlag flag) const;
    const ProjectRequest& request() const { return request_; }
    const ValidationResult& validation() const { return validation_; }

    // ── Environment ──────────────────────────────────────────
    const CapabilityStatus& capability(Capability cap) const;
    bool probing() const;                        // any capability still Checking
    bool environment_ready() const;              // all three Available

    // Reset all capabilities to Checking and probe again. Results from any
    // earlier probe that arrive later are dropped.
    void request_reprobe();

    // ── Execution ────────────────────────────────────────────
    bool busy() const { return busy_; }
    bool can_create() const;

    // Start the scaffolding script for a snapshot of the current request.
    // No-op returning Err (with the reason) unless can_create(). If the run
    // worker cannot be started, busy is cleared again, an Error entry is
    // logged and Err is returned.
    Result<void> create();

    // Program and arguments create() would run right now.
    std::string scaffold_program() const;
    std::vector<std::string> scaffold_args() const;

    const std::optional<RunOutcome>& last_outcome() const { return last_outcome_; }

    // Request as it was when the latest create() started. Later edits to the
    // form do not change it.
    const ProjectRequest& run_request() const { return run_request_; }

    // ── Log ──────────────────────────────────────────────────
    const std::vector<LogEntry>& log() const { return log_; }
    void append_status(const std::string& text);
    Result<void> save_log(const fs::path& path) const;

    // ── Events ───────────────────────────────────────────────
    // Apply pending background results. Returns the number applied.
    std::size_t process_events();

    // Block up to timeout_ms (-1 = forever) for background results.
    bool wait_for_events(int timeout_ms);

    // Pump events until pred() holds or timeout_ms passes (-1 = forever).
    bool pump_until(const std::function<bool()>& pred, int timeout_ms = -1);

    int wakeup_fd() const { return events_.wakeup_fd(); }

    const Config& config() const { return config_; }

protected:
    // Run fn on a new background thread. Throws std::system_error when the
    // thread cannot be created.
    virtual void start_worker(std::function<void()> fn);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void start_probe();
    void reap_workers(bool all);
    void on_probe_result(Capability cap, std::uint64_t generation, CapabilityStatus status);
    void on_run_finished(const RunOutcome& outcome);

    Config config_;
    std::unique_ptr<CommandLauncher> launcher_;
    CapabilityProbe probe_;
    ProcessRunner runner_;
    EventQueue events_;

    ProjectRequest request_;
    ValidationResult validation_;
    CapabilitySet capabilities_;
    std::array<std::uint64_t, CAPABILITY_COUNT> generation_{};
    bool busy_ = false;
    std::optional<RunOutcome> last_outcome_;
    ProjectRequest run_request_;
    std::vector<LogEntry> log_;

    std::vector<Worker> workers_;                // touched on the UI thread only
};
