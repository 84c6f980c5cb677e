#include "event_queue.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <chrono>
#include <system_error>

EventQueue::EventQueue() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::system_error(errno, std::generic_category(), "event queue pipe");
    }
    wake_read_ = fds[0];
    wake_write_ = fds[1];
}

EventQueue::~EventQueue() {
    if (wake_read_ >= 0) close(wake_read_);
    if (wake_write_ >= 0) close(wake_write_);
}

void EventQueue::post(Event ev) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(ev));
    }
    cv_.notify_all();

    // A full pipe already means "wake up"; EAGAIN is fine.
    char b = 1;
    ssize_t n = write(wake_write_, &b, 1);
    (void)n;
}

void EventQueue::drain_wakeup() {
    char buf[64];
    while (read(wake_read_, buf, sizeof(buf)) > 0) {}
}

std::size_t EventQueue::dispatch() {
    drain_wakeup();

    std::deque<Event> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(pending_);
    }

    for (auto& ev : batch) {
        ev();
    }
    return batch.size();
}

bool EventQueue::wait(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout_ms < 0) {
        cv_.wait(lock, [this] { return !pending_.empty(); });
        return true;
    }
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                        [this] { return !pending_.empty(); });
}
