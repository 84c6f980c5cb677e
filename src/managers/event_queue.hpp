#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <condition_variable>

// FIFO of closures posted by background threads and run on the UI thread.
//
// post() is thread-safe and also writes a byte to a self-pipe so an event
// loop blocked in poll() on wakeup_fd() wakes up. dispatch() must only be
// called from the thread that owns the state the events mutate.
class EventQueue {
public:
    using Event = std::function<void()>;

    EventQueue();
    ~EventQueue();

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void post(Event ev);

    // Run every event queued so far, in posting order. Returns how many ran.
    std::size_t dispatch();

    // Block until an event is pending or timeout_ms elapses (-1 = forever).
    // Returns true if something is pending.
    bool wait(int timeout_ms);

    // Readable whenever events are pending.
    int wakeup_fd() const { return wake_read_; }

private:
    void drain_wakeup();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> pending_;
    int wake_read_ = -1;
    int wake_write_ = -1;
};
