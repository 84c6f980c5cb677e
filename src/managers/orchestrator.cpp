#include "orchestrator.hpp"
#include <core/constants.hpp>
#include <core/debug_log.hpp>
#include <core/name_validator.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>

static std::unique_ptr<CommandLauncher> launcher_or_default(std::unique_ptr<CommandLauncher> launcher) {
    if (launcher) return launcher;
    return std::make_unique<SystemCommandLauncher>();
}

// ── Construction / Destruction ──────────────────────────────

Orchestrator::Orchestrator(Config config,
                           std::unique_ptr<CommandLauncher> launcher,
                           bool probe_on_start)
    : config_(std::move(config)),
      launcher_(launcher_or_default(std::move(launcher))),
      probe_(*launcher_),
      runner_(config_.scaffold().workdir.string()) {
    validation_ = validate_project_name(request_.name);
    if (probe_on_start) {
        start_probe();
    }
}

Orchestrator::~Orchestrator() {
    if (busy_) {
        mkproj_log("orchestrator: shutting down, waiting for the running script to exit");
    }
    reap_workers(true);
}

// ── Form ────────────────────────────────────────────────────

void Orchestrator::set_name(const std::string& name) {
    request_.name = name;
    validation_ = validate_project_name(name);
}

void Orchestrator::set_flag(CreateFlag flag, bool value) {
    request_.flags.set(flag, value);
}

bool Orchestrator::flag(CreateFlag flag) const {
    return request_.flags.get(flag);
}

// ── Environment ─────────────────────────────────────────────

const CapabilityStatus& Orchestrator::capability(Capability cap) const {
    return capabilities_[capability_index(cap)];
}

bool Orchestrator::probing() const {
    return std::any_of(capabilities_.begin(), capabilities_.end(),
                       [](const CapabilityStatus& s) { return s.is_checking(); });
}

bool Orchestrator::environment_ready() const {
    return std::all_of(capabilities_.begin(), capabilities_.end(),
                       [](const CapabilityStatus& s) { return s.is_available(); });
}

void Orchestrator::request_reprobe() {
    mkproj_log("orchestrator: re-probe requested");
    start_probe();
}

void Orchestrator::start_probe() {
    reap_workers(false);

    for (Capability cap : ALL_CAPABILITIES) {
        std::size_t i = capability_index(cap);
        capabilities_[i] = CapabilityStatus::checking();
        std::uint64_t generation = ++generation_[i];
        ProbeChain chain = config_.probes().chain(cap);

        try {
            start_worker([this, cap, generation, chain] {
                CapabilityStatus status = probe_.probe_one(cap, chain);
                events_.post([this, cap, generation, status] {
                    on_probe_result(cap, generation, status);
                });
            });
        } catch (const std::system_error& e) {
            mkproj_log(fmt::format("orchestrator: cannot start {} probe: {}",
                                   capability_name(cap), e.what()));
            capabilities_[i] = CapabilityStatus::unavailable(
                std::string("Could not run the check: ") + e.what() + ". Try 'recheck'.");
        }
    }
}

void Orchestrator::on_probe_result(Capability cap, std::uint64_t generation, CapabilityStatus status) {
    std::size_t i = capability_index(cap);
    if (generation != generation_[i]) {
        mkproj_log(fmt::format("orchestrator: dropping stale {} result (generation {}, current {})",
                               capability_name(cap), generation, generation_[i]));
        return;
    }
    capabilities_[i] = std::move(status);
}

// ── Execution ───────────────────────────────────────────────

bool Orchestrator::can_create() const {
    return !busy_ && validation_.valid && environment_ready();
}

std::string Orchestrator::scaffold_program() const {
    const std::string& configured = config_.scaffold().interpreter;
    if (configured != INTERPRETER_AUTO && !configured.empty()) {
        return configured;
    }
    const auto& interp = capability(Capability::Interpreter);
    if (interp.is_available() && interp.via) {
        return interp.via->program;
    }
    return DEFAULT_INTERPRETER;
}

std::vector<std::string> Orchestrator::scaffold_args() const {
    return build_scaffold_args(config_.script_path().string(), request_);
}

Result<void> Orchestrator::create() {
    if (busy_) {
        return Result<void>::Err("A project is already being created.");
    }
    if (!validation_.valid) {
        return Result<void>::Err(validation_.message);
    }
    if (probing()) {
        return Result<void>::Err("The environment check is still running.");
    }
    if (!environment_ready()) {
        return Result<void>::Err("Required tools are missing. Run 'recheck' after installing them.");
    }

    // busy goes up before anything observable happens
    busy_ = true;
    last_outcome_.reset();
    run_request_ = request_;

    std::string program = scaffold_program();
    std::vector<std::string> args = scaffold_args();
    mkproj_log(fmt::format("orchestrator: create '{}'", request_.name));

    reap_workers(false);
    try {
        start_worker([this, program, args] {
            RunOutcome outcome;
            try {
                outcome = runner_.run(program, args, [this](const LogEntry& entry) {
                    events_.post([this, entry] { log_.push_back(entry); });
                });
            } catch (const std::exception& e) {
                mkproj_log(fmt::format("orchestrator: run aborted: {}", e.what()));
                LogEntry failure{LogKind::Error, std::string("Run aborted: ") + e.what()};
                events_.post([this, failure] { log_.push_back(failure); });
            }
            // Same FIFO as the entries: busy drops only after the last one lands.
            events_.post([this, outcome] { on_run_finished(outcome); });
        });
    } catch (const std::system_error& e) {
        mkproj_log(fmt::format("orchestrator: cannot start run worker: {}", e.what()));
        busy_ = false;
        last_outcome_ = RunOutcome{};
        std::string message = std::string("Failed to start: ") + e.what();
        log_.push_back({LogKind::Error, message});
        return Result<void>::Err(message);
    }

    return Result<void>::Ok();
}

void Orchestrator::on_run_finished(const RunOutcome& outcome) {
    last_outcome_ = outcome;
    busy_ = false;
}

// ── Log ─────────────────────────────────────────────────────

void Orchestrator::append_status(const std::string& text) {
    log_.push_back({LogKind::Status, text});
}

Result<void> Orchestrator::save_log(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err("Cannot open " + path.string() + " for writing");
    }
    out << "# mkproj log, saved " << now_iso() << "\n";
    for (const auto& entry : log_) {
        out << entry.text << "\n";
    }
    out.close();
    if (!out) {
        return Result<void>::Err("Failed writing " + path.string());
    }
    return Result<void>::Ok();
}

// ── Events ──────────────────────────────────────────────────

std::size_t Orchestrator::process_events() {
    std::size_t n = events_.dispatch();
    if (n > 0) reap_workers(false);
    return n;
}

bool Orchestrator::wait_for_events(int timeout_ms) {
    return events_.wait(timeout_ms);
}

bool Orchestrator::pump_until(const std::function<bool()>& pred, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));

    process_events();
    while (!pred()) {
        int slice = EVENT_WAIT_SLICE_MS;
        if (timeout_ms >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (left.count() <= 0) return false;
            slice = std::min<int>(slice, static_cast<int>(left.count()));
        }
        wait_for_events(slice);
        process_events();
    }
    return true;
}

// ── Workers ─────────────────────────────────────────────────

void Orchestrator::start_worker(std::function<void()> fn) {
    Worker w;
    w.done = std::make_shared<std::atomic<bool>>(false);
    auto done = w.done;
    w.thread = std::thread([fn = std::move(fn), done] {
        try {
            fn();
        } catch (const std::exception& e) {
            mkproj_log(fmt::format("orchestrator: worker failed: {}", e.what()));
        }
        done->store(true);
    });
    workers_.push_back(std::move(w));
}

void Orchestrator::reap_workers(bool all) {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (all || it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}
