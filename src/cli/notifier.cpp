#include "notifier.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/debug_log.hpp>
#include <managers/process_runner.hpp>
#include <platform/platform.hpp>

Notification describe_run(const std::string& project, const RunOutcome& outcome) {
    if (outcome.success()) {
        return {"Project created",
                fmt::format("Project '{}' has been created successfully!", project)};
    }
    if (!outcome.spawned) {
        return {"Project creation failed",
                fmt::format("Failed to create project '{}': the script could not be started.", project)};
    }
    return {"Project creation failed",
            fmt::format("Failed to create project '{}' ({}).", project, format_exit_line(outcome))};
}

Notifier::Notifier(NotifySettings settings) : settings_(std::move(settings)) {}

Notifier::~Notifier() {
    for (int waited = 0; waited < NOTIFY_GRACE_MS; waited += TERMINATE_POLL_MS) {
        reap();
        if (helpers_.empty()) return;
        platform::sleep_ms(TERMINATE_POLL_MS);
    }
    for (auto& helper : helpers_) {
        mkproj_log(fmt::format("notify: pid {} still running, terminating", helper.native_handle()));
        helper.terminate();
    }
}

std::string Notifier::run_finished(const std::string& project, const RunOutcome& outcome) {
    if (!settings_.enabled) return "";
    reap();

    Notification n = describe_run(project, outcome);
    auto spawned = platform::spawn(settings_.program,
                                   {"--app-name", NOTIFY_APP_NAME, n.summary, n.body},
                                   platform::OutputMode::Discard);
    if (spawned.is_err()) {
        mkproj_log("notify: " + spawned.error);
    } else {
        mkproj_log(fmt::format("notify: pid {} '{}'", spawned.value.native_handle(), n.summary));
        helpers_.push_back(std::move(spawned.value));
    }
    return "\a";
}

void Notifier::reap() {
    helpers_.erase(std::remove_if(helpers_.begin(), helpers_.end(),
                                  [](platform::ProcessHandle& h) { return !h.running(); }),
                   helpers_.end());
}
