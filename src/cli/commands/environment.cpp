#include "../base_cli.hpp"
#include "../status_view.hpp"
#include "../theme.hpp"
#include <iostream>

static void do_env(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_orchestrator()) return;

    cli.orchestrator->process_events();
    std::cout << theme::section("Environment");
    for (Capability cap : ALL_CAPABILITIES) {
        std::cout << render_capability(cap, cli.orchestrator->capability(cap));
    }
    std::cout << "\n";
}

static void do_recheck(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_orchestrator()) return;

    cli.orchestrator->request_reprobe();
    std::cout << theme::info("Checking environment...");
}

void register_environment_commands(BaseCLI& cli) {
    cli.add_command("env", do_env, "Show tool availability");
    cli.add_command("recheck", do_recheck, "Check for Python, pip and venv again");
}
