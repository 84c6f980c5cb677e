#include "line_channel.hpp"

void LineChannel::push(LogKind kind, std::string text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back({kind, std::move(text)});
    }
    cv_.notify_one();
}

void LineChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_producers_ > 0) open_producers_--;
    }
    cv_.notify_one();
}

bool LineChannel::pop(LogEntry& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !lines_.empty() || open_producers_ == 0; });
    if (lines_.empty()) return false;
    out = std::move(lines_.front());
    lines_.pop_front();
    return true;
}
