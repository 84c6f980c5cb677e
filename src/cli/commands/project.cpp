#include "../base_cli.hpp"
#include "../status_view.hpp"
#include "../theme.hpp"
#include <iostream>
#include <sstream>
#include <core/utils.hpp>

static void do_name(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_orchestrator()) return;

    cli.orchestrator->set_name(arg);
    const auto& v = cli.orchestrator->validation();
    if (v.valid) {
        std::cout << theme::ok("Project name: " + arg);
    } else {
        std::cout << theme::fail(v.message);
    }
}

static void do_set(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_orchestrator()) return;

    std::istringstream iss(arg);
    std::string name, value;
    iss >> name >> value;

    auto flag = parse_flag_name(name);
    if (!flag || (value != "on" && value != "off")) {
        std::cout << theme::fail("Usage: set <venv|install|refresh|force> <on|off>");
        return;
    }
    cli.orchestrator->set_flag(*flag, value == "on");
    std::cout << theme::ok(std::string(flag_name(*flag)) + " " + value);
}

static void do_toggle(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_orchestrator()) return;

    std::string name = arg;
    trim(name);
    auto flag = parse_flag_name(name);
    if (!flag) {
        std::cout << theme::fail("Usage: toggle <venv|install|refresh|force>");
        return;
    }
    bool value = !cli.orchestrator->flag(*flag);
    cli.orchestrator->set_flag(*flag, value);
    std::cout << theme::ok(std::string(flag_name(*flag)) + (value ? " on" : " off"));
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_orchestrator()) return;

    cli.orchestrator->process_events();
    std::cout << render_status(*cli.orchestrator);
    if (!cli.config_error.empty()) {
        std::cout << "\n" << theme::fail("Config: " + cli.config_error);
    }
    std::cout << "\n";
}

static void do_create(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_orchestrator()) return;

    // Results that already arrived count toward the gate
    cli.orchestrator->process_events();

    auto result = cli.orchestrator->create();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::info("Creating '" + cli.orchestrator->request().name
                             + "'. Output follows; the prompt stays usable.");
}

void register_project_commands(BaseCLI& cli) {
    cli.add_command("name", do_name, "Set the project name");
    cli.add_command("set", do_set, "Set a flag: set <venv|install|refresh|force> <on|off>");
    cli.add_command("toggle", do_toggle, "Flip a flag");
    cli.add_command("status", do_status, "Show project, flags and environment");
    cli.add_command("create", do_create, "Run the scaffolding script");
}
