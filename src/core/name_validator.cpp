#include "name_validator.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <regex>

static const char* const RESERVED_NAMES[] = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

bool is_reserved_device_name(const std::string& name) {
    std::string upper = to_upper_ascii(name);
    for (const char* reserved : RESERVED_NAMES) {
        if (upper == reserved) return true;
    }
    return false;
}

ValidationResult validate_project_name(const std::string& name) {
    std::string stripped = name;
    trim(stripped);
    if (stripped.empty()) {
        return {false, "Project name is required."};
    }

    static const std::regex pattern(
        fmt::format("^[A-Za-z0-9][A-Za-z0-9._-]{{0,{}}}$", MAX_PROJECT_NAME_LEN - 1));
    if (!std::regex_match(name, pattern)) {
        return {false, fmt::format(
            "Use ASCII letters, digits, '.', '_' or '-', starting with a letter or digit "
            "(1-{} characters, no spaces).", MAX_PROJECT_NAME_LEN)};
    }

    // A trailing '.' passes the pattern; both characters break directory names on Windows.
    if (name.back() == '.' || name.back() == ' ') {
        return {false, "Project name must not end with '.' or a space."};
    }

    if (is_reserved_device_name(name)) {
        return {false, fmt::format("'{}' is a reserved device name on Windows.", name)};
    }

    return {true, ""};
}
