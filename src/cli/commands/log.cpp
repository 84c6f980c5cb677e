#include "../base_cli.hpp"
#include "../status_view.hpp"
#include "../theme.hpp"
#include <iostream>
#include <sstream>
#include <core/utils.hpp>

static constexpr std::size_t DEFAULT_LOG_TAIL = 40;

static void show_tail(BaseCLI& cli, std::size_t count) {
    const auto& log = cli.orchestrator->log();
    if (log.empty()) {
        std::cout << theme::dim("    Log is empty.") << "\n";
        return;
    }
    std::size_t start = log.size() > count ? log.size() - count : 0;
    if (start > 0) {
        std::cout << theme::dim("    ... " + std::to_string(start) + " earlier lines") << "\n";
    }
    for (std::size_t i = start; i < log.size(); i++) {
        std::cout << render_entry(log[i]);
    }
}

static void do_log(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_orchestrator()) return;

    cli.orchestrator->process_events();

    std::istringstream iss(arg);
    std::string sub;
    iss >> sub;

    if (sub.empty()) {
        show_tail(cli, DEFAULT_LOG_TAIL);
        return;
    }

    if (sub == "save") {
        std::string path;
        std::getline(iss, path);
        trim(path);
        if (path.empty()) {
            std::cout << theme::fail("Usage: log save <path>");
            return;
        }
        auto r = cli.orchestrator->save_log(path);
        if (r.is_err()) {
            std::cout << theme::fail(r.error);
        } else {
            std::cout << theme::ok("Log saved to " + path);
        }
        return;
    }

    std::size_t count = 0;
    try {
        count = std::stoul(sub);
    } catch (const std::exception&) {
        std::cout << theme::fail("Usage: log [N] | log save <path>");
        return;
    }
    show_tail(cli, count);
}

void register_log_commands(BaseCLI& cli) {
    cli.add_command("log", do_log, "Show the log: log [N], log save <path>");
}
