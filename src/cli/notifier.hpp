#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <platform/process.hpp>

// Summary and body of a desktop notification.
struct Notification {
    std::string summary;
    std::string body;
};

Notification describe_run(const std::string& project, const RunOutcome& outcome);

// Tells the user a run has finished: a terminal bell, plus a desktop
// notification through an external program (notify-send by default).
// Notification helpers run detached from the UI; failing to start one is
// logged and otherwise ignored.
class Notifier {
public:
    explicit Notifier(NotifySettings settings);

    // Gives running helpers NOTIFY_GRACE_MS to finish, then terminates them.
    ~Notifier();

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    // Returns the text to print (the bell, or "" when disabled).
    std::string run_finished(const std::string& project, const RunOutcome& outcome);

    // Reap helpers that have exited.
    void reap();

    std::size_t pending() const { return helpers_.size(); }
    bool enabled() const { return settings_.enabled; }

private:
    NotifySettings settings_;
    std::vector<platform::ProcessHandle> helpers_;
};
