#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include <core/types.hpp>

// Many-producer, single-consumer queue of log lines.
//
// Each stream reader pushes complete lines and calls close() once at
// end-of-stream. pop() hands lines out in arrival order and returns false
// once every producer has closed and the queue is empty.
class LineChannel {
public:
    explicit LineChannel(int producers) : open_producers_(producers) {}

    void push(LogKind kind, std::string text);
    void close();
    bool pop(LogEntry& out);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<LogEntry> lines_;
    int open_producers_;
};
