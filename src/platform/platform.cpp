#include "platform.hpp"
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

std::string errno_message(int err) {
    char buf[256];
    // GNU strerror_r may return a static string instead of filling buf
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
    return std::string(strerror_r(err, buf, sizeof(buf)));
#else
    if (strerror_r(err, buf, sizeof(buf)) != 0) return "errno " + std::to_string(err);
    return std::string(buf);
#endif
}

int wait_readable(const std::vector<int>& fds, int timeout_ms) {
    std::vector<struct pollfd> pfds;
    for (int fd : fds) {
        pfds.push_back({fd, POLLIN, 0});
    }

    int n;
    do {
        n = poll(pfds.data(), pfds.size(), timeout_ms);
    } while (n < 0 && errno == EINTR);
    if (n < 0) return -1;

    int mask = 0;
    for (std::size_t i = 0; i < pfds.size(); i++) {
        if (pfds[i].fd >= 0 && (pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
            mask |= 1 << i;
        }
    }
    return mask;
}

} // namespace platform
