#include <iostream>
#include <vector>
#include <string>
#include "cli/mkproj_cli.hpp"
#include "cli/status_view.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>

static void usage_row(const std::string& cmd, const std::string& arg, const std::string& desc) {
    std::cout << theme::color::TEAL << "    " << cmd
              << theme::color::RESET << theme::color::SAND << arg
              << theme::color::RESET << theme::color::DIM
              << desc << theme::color::RESET << "\n";
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    usage_row("mkproj", "", "                     Enter the interactive prompt");
    usage_row("mkproj check", "", "               Check for Python, pip and venv");
    usage_row("mkproj init", "", "                Write a default ~/.mkproj/config.yaml");
    usage_row("mkproj create ", "<name>", "       Create a project and exit");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    create options: --force --venv --install --refresh-templates\n\n"
              << "    mkproj --version        Show version\n"
              << "    mkproj --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string cmd = argv[1];
            if (cmd == "--version") {
                std::cout << theme::color::SAND << theme::color::BOLD << "mkproj"
                          << theme::color::RESET << theme::color::DIM
                          << " version " MKPROJ_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (cmd == "--help" || cmd == "-h") {
                print_usage();
                return 0;
            }
        }

        MkprojCLI cli;

        if (argc == 1) {
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "check") {
            return cli.run_check();
        } else if (cmd == "init") {
            return cli.run_init();
        } else if (cmd == "create") {
            std::string name;
            CreateFlags flags;
            for (int i = 2; i < argc; i++) {
                std::string arg = argv[i];
                if (arg.rfind("--", 0) == 0) {
                    auto flag = parse_flag_name(arg);
                    if (!flag) {
                        std::cout << theme::fail("Unknown option: " + arg);
                        return 1;
                    }
                    flags.set(*flag, true);
                } else if (name.empty()) {
                    name = arg;
                } else {
                    std::cout << theme::fail("Unexpected argument: " + arg);
                    return 1;
                }
            }
            if (name.empty()) {
                std::cout << theme::fail("Missing project name.");
                std::cout << theme::step("Usage: mkproj create <name> [--force] [--venv] [--install] [--refresh-templates]");
                return 1;
            }
            return cli.run_create(name, flags);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
