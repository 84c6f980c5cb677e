#include "config.hpp"
#include "constants.hpp"
#include "debug_log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// ── ProbeSettings ─────────────────────────────────────────────

const ProbeChain& ProbeSettings::chain(Capability cap) const {
    switch (cap) {
        case Capability::Interpreter:      return interpreter;
        case Capability::PackageInstaller: return package_installer;
        case Capability::VenvTool:         break;
    }
    return venv_tool;
}

ProbeChain& ProbeSettings::chain(Capability cap) {
    return const_cast<ProbeChain&>(static_cast<const ProbeSettings&>(*this).chain(cap));
}

ProbeChain make_probe_chain(const std::vector<std::vector<std::string>>& rows) {
    ProbeChain chain;
    for (const auto& row : rows) {
        if (row.empty()) continue;
        ProbeCandidate c;
        c.program = row[0];
        c.args.assign(row.begin() + 1, row.end());
        chain.push_back(std::move(c));
    }
    return chain;
}

// ── YAML parsing ──────────────────────────────────────────────

// A candidate is either a list ([python3, --version]) or a single string
// split on whitespace ("python3 --version").
static Result<ProbeCandidate> parse_candidate(const YAML::Node& node) {
    std::vector<std::string> words;
    if (node.IsSequence()) {
        for (const auto& w : node) {
            if (!w.IsScalar()) {
                return Result<ProbeCandidate>::Err("candidate entries must be strings");
            }
            words.push_back(w.as<std::string>());
        }
    } else if (node.IsScalar()) {
        std::istringstream iss(node.as<std::string>());
        std::string w;
        while (iss >> w) words.push_back(w);
    } else {
        return Result<ProbeCandidate>::Err("candidate must be a list or a string");
    }

    if (words.empty() || words[0].empty()) {
        return Result<ProbeCandidate>::Err("empty candidate");
    }

    ProbeCandidate c;
    c.program = words[0];
    c.args.assign(words.begin() + 1, words.end());
    return Result<ProbeCandidate>::Ok(c);
}

static Result<ProbeChain> parse_chain(const YAML::Node& node, const std::string& key) {
    if (!node.IsSequence() || node.size() == 0) {
        return Result<ProbeChain>::Err(fmt::format("probes.{} must be a non-empty list", key));
    }
    ProbeChain chain;
    for (std::size_t i = 0; i < node.size(); i++) {
        auto c = parse_candidate(node[i]);
        if (c.is_err()) {
            return Result<ProbeChain>::Err(fmt::format("probes.{}[{}]: {}", key, i, c.error));
        }
        chain.push_back(c.value);
    }
    return Result<ProbeChain>::Ok(chain);
}

Result<void> Config::overlay(const YAML::Node& root, const fs::path& dir) {
    if (!root || root.IsNull()) return Result<void>::Ok();
    if (!root.IsMap()) return Result<void>::Err("top level must be a mapping");

    if (root["interpreter"]) {
        scaffold_.interpreter = root["interpreter"].as<std::string>();
    }
    if (root["script"]) {
        scaffold_.script = root["script"].as<std::string>();
    }
    if (root["workdir"]) {
        fs::path w = root["workdir"].as<std::string>();
        scaffold_.workdir = w.is_absolute() ? w : (dir / w).lexically_normal();
    }

    const YAML::Node notify = root["notify"];
    if (notify) {
        if (notify.IsScalar()) {
            notify_.enabled = notify.as<bool>();
        } else if (notify.IsMap()) {
            if (notify["enabled"]) notify_.enabled = notify["enabled"].as<bool>();
            if (notify["program"]) notify_.program = notify["program"].as<std::string>();
        } else {
            return Result<void>::Err("notify must be true, false or a mapping");
        }
        if (notify_.program.empty()) return Result<void>::Err("notify.program must not be empty");
    }

    const YAML::Node probes = root["probes"];
    if (probes) {
        if (!probes.IsMap()) return Result<void>::Err("probes must be a mapping");

        const std::pair<const char*, Capability> keys[] = {
            {"interpreter", Capability::Interpreter},
            {"package_installer", Capability::PackageInstaller},
            {"venv_tool", Capability::VenvTool},
        };
        for (const auto& [key, cap] : keys) {
            if (!probes[key]) continue;
            auto chain = parse_chain(probes[key], key);
            if (chain.is_err()) return Result<void>::Err(chain.error);
            probes_.chain(cap) = chain.value;
        }
    }

    return Result<void>::Ok();
}

Result<void> Config::overlay_file(const fs::path& path, const fs::path& dir) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        auto r = overlay(root, dir);
        if (r.is_err()) {
            return Result<void>::Err(fmt::format("{}: {}", path.string(), r.error));
        }
        sources_.push_back(path);
        mkproj_log("config: loaded " + path.string());
        return Result<void>::Ok();
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

// ── Paths ─────────────────────────────────────────────────────

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".mkproj";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "mkproj.yaml";
}

// ── Loading ───────────────────────────────────────────────────

Config Config::defaults(const fs::path& dir) {
    Config config;
    config.scaffold_.interpreter = INTERPRETER_AUTO;
    config.scaffold_.script = DEFAULT_SCRIPT;
    config.scaffold_.workdir = dir;
    config.probes_.interpreter = make_probe_chain(INTERPRETER_PROBES);
    config.probes_.package_installer = make_probe_chain(PACKAGE_INSTALLER_PROBES);
    config.probes_.venv_tool = make_probe_chain(VENV_TOOL_PROBES);
    config.notify_.program = NOTIFY_PROGRAM;
    return config;
}

Result<Config> Config::load_global(const fs::path& dir) {
    Config config = defaults(dir);
    if (!global_config_exists()) {
        return Result<Config>::Ok(config);
    }
    auto r = config.overlay_file(get_global_config_path(), dir);
    if (r.is_err()) return Result<Config>::Err(r.error);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_project(const fs::path& dir) {
    Config config = defaults(dir);
    if (!project_config_exists(dir)) {
        return Result<Config>::Ok(config);
    }
    auto r = config.overlay_file(get_project_config_path(dir), dir);
    if (r.is_err()) return Result<Config>::Err(r.error);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& dir) {
    // Load global first
    auto global_result = load_global(dir);
    if (global_result.is_err()) {
        return global_result;
    }

    Config config = global_result.value;

    // Project file overrides whatever it names
    if (project_config_exists(dir)) {
        auto r = config.overlay_file(get_project_config_path(dir), dir);
        if (r.is_err()) return Result<Config>::Err(r.error);
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text, const fs::path& dir) {
    Config config = defaults(dir);
    try {
        auto r = config.overlay(YAML::Load(yaml_text), dir);
        if (r.is_err()) return Result<Config>::Err(r.error);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
    return Result<Config>::Ok(config);
}

fs::path Config::script_path() const {
    fs::path script = scaffold_.script;
    if (script.is_absolute()) return script;
    return (scaffold_.workdir / script).lexically_normal();
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() + ": " + ec.message());
    }

    const char* default_config = R"(# mkproj configuration
# A mkproj.yaml in the working directory overrides any key set here.

# Interpreter used to run the scaffolding script.
# "auto" picks whichever interpreter the environment check found.
interpreter: auto

# Scaffolding script; relative paths resolve against workdir.
script: create_project.py

# Working directory for the script (defaults to where mkproj starts).
# workdir: .

# Ring the terminal bell and show a desktop notification (notify-send)
# when a project run finishes. A mapping picks another notifier:
#   notify: {enabled: true, program: notify-send}
notify: true

# Optional: replace the candidate commands used to detect each tool.
# Candidates are tried in order; the first that exits 0 wins.
# probes:
#   interpreter:
#     - [python3, --version]
#   package_installer:
#     - [python3, -m, pip, --version]
#   venv_tool:
#     - [python3, -c, "import venv"]
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}
