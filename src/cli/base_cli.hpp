#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <core/config.hpp>
#include <managers/orchestrator.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Creates the orchestrator (which starts probing) if not yet running.
    void init_orchestrator();
    bool require_orchestrator();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    void request_quit() { quit_requested_ = true; }
    bool quit_requested() const { return quit_requested_; }

    // Public state
    Config config;
    std::string config_error;                   // set when config failed to load; defaults in use
    std::unique_ptr<Orchestrator> orchestrator;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    bool quit_requested_ = false;
};
