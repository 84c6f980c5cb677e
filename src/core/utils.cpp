#include "utils.hpp"
#include <chrono>
#include <ctime>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string shell_quote(const std::string& arg) {
    if (arg.empty()) return "''";

    bool needs_quotes = arg.find_first_of(" \t\n'\"\\$`;&|<>()*?![]{}#~") != std::string::npos;
    if (!needs_quotes) return arg;

    // Single quotes; an embedded ' becomes '\''
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string join_command_line(const std::string& program,
                              const std::vector<std::string>& args) {
    std::string line = shell_quote(program);
    for (const auto& a : args) {
        line += " ";
        line += shell_quote(a);
    }
    return line;
}

std::string to_upper_ascii(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return out;
}
