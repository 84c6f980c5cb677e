#pragma once

#include <string>
#include <vector>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Quote an argument for display when it contains whitespace or shell metacharacters.
std::string shell_quote(const std::string& arg);

// Render "program arg1 arg2 ..." with each piece quoted as needed.
std::string join_command_line(const std::string& program,
                              const std::vector<std::string>& args);

// ASCII-only uppercase copy.
std::string to_upper_ascii(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
