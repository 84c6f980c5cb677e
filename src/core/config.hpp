#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

namespace YAML { class Node; }

// How the scaffolding script is invoked.
struct ScaffoldSettings {
    std::string interpreter;     // program name, or "auto" for the probed interpreter
    std::string script;          // relative paths resolve against workdir
    fs::path workdir;            // child working directory
};

// What happens when a run finishes.
struct NotifySettings {
    bool enabled = true;         // terminal bell plus a desktop notification
    std::string program;         // desktop notifier, looked up on PATH
};

// Candidate chains for the three capabilities.
struct ProbeSettings {
    ProbeChain interpreter;
    ProbeChain package_installer;
    ProbeChain venv_tool;

    const ProbeChain& chain(Capability cap) const;
    ProbeChain& chain(Capability cap);
};

class Config {
public:
    // Built-in defaults rooted at `dir`.
    static Config defaults(const fs::path& dir = fs::current_path());

    // Defaults overlaid with ~/.mkproj/config.yaml. A missing file is not an error.
    static Result<Config> load_global(const fs::path& dir = fs::current_path());

    // Defaults overlaid with dir/mkproj.yaml. A missing file is not an error.
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Defaults, then global, then project (project wins).
    static Result<Config> load(const fs::path& dir = fs::current_path());

    // Defaults overlaid with YAML text (used for files and tests alike).
    static Result<Config> parse(const std::string& yaml_text,
                                const fs::path& dir = fs::current_path());

    const ScaffoldSettings& scaffold() const { return scaffold_; }
    const ProbeSettings& probes() const { return probes_; }
    const NotifySettings& notify() const { return notify_; }

    // Files that contributed to this config, in load order.
    const std::vector<fs::path>& sources() const { return sources_; }

    // Absolute path of the scaffolding script.
    fs::path script_path() const;

    void set_interpreter(const std::string& interpreter) { scaffold_.interpreter = interpreter; }
    void set_probe_chain(Capability cap, ProbeChain chain) { probes_.chain(cap) = std::move(chain); }
    void set_notify(bool enabled) { notify_.enabled = enabled; }

public:
    Config() = default;

private:
    Result<void> overlay(const YAML::Node& root, const fs::path& dir);
    Result<void> overlay_file(const fs::path& path, const fs::path& dir);

    ScaffoldSettings scaffold_;
    ProbeSettings probes_;
    NotifySettings notify_;
    std::vector<fs::path> sources_;
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Convert a constants.hpp candidate table into a chain.
ProbeChain make_probe_chain(const std::vector<std::vector<std::string>>& rows);

// Create default global config
Result<void> create_default_global_config();
