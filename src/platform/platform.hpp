#pragma once

#include <string>
#include <filesystem>
#include <vector>

namespace platform {

// Returns the user's home directory (HOME), or the temp directory if unset.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Human-readable description of an errno value.
std::string errno_message(int err);

// Block until one of `fds` is readable or hung up, or timeout_ms passes
// (-1 = forever). Negative entries are not watched. Returns a mask with bit
// i set when fds[i] is ready, 0 on timeout, -1 on error. EINTR is retried.
int wait_readable(const std::vector<int>& fds, int timeout_ms);

} // namespace platform
