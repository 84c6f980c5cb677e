#include "base_cli.hpp"
#include "theme.hpp"
#include <core/debug_log.hpp>
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config = Config::defaults();
        config_error = config_result.error;
        mkproj_log("config: " + config_error + " (using defaults)");
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

void BaseCLI::init_orchestrator() {
    if (!orchestrator) {
        orchestrator = std::make_unique<Orchestrator>(config);
    }
}

bool BaseCLI::require_orchestrator() {
    if (!orchestrator) {
        std::cout << theme::fail("Not initialized.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Project",     {"name", "set", "toggle", "status", "create"}},
        {"Environment", {"env", "recheck"}},
        {"Log",         {"log"}},
        {"General",     {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::SAND << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::TEAL
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::SAND) + "mkproj" + rl_esc(theme::color::RESET);
    if (!orchestrator) {
        return prompt + "> ";
    }

    const auto& name = orchestrator->request().name;
    if (!name.empty()) {
        const std::string& name_color = orchestrator->validation().valid
            ? theme::color::TEAL : theme::color::RED;
        prompt += ":" + rl_esc(name_color) + name + rl_esc(theme::color::RESET);
    }
    if (orchestrator->busy()) {
        prompt += rl_esc(theme::color::YELLOW) + " (running)" + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}
