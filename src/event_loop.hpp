#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

// Single-threaded cooperative scheduler. Tasks are step functions that run to
// completion and then suspend until their next due time; sockets are
// multiplexed with poll(2). Nothing here is thread-safe except stop().
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using Millis = std::chrono::milliseconds;
    using TaskId = uint64_t;
    using WatchId = uint64_t;

    // Returns the delay before the next step, or nullopt when the task is done.
    using Step = std::function<std::optional<Millis>()>;

    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    TaskId schedule(std::string name, Step step, Millis first_delay = Millis(0));

    // Fixed-interval task; the first run happens after `interval` unless run_now.
    TaskId every(std::string name, Millis interval, std::function<void()> fn, bool run_now = false);

    // Safe to call from inside any step, including the task's own.
    bool cancel(TaskId id);
    bool is_active(TaskId id) const;
    size_t task_count() const;

    WatchId watch_readable(int fd, std::function<void()> on_ready);
    void unwatch(WatchId id);

    // One scheduling pass: wait for the earliest due task (at most max_wait)
    // or socket readiness, then run whatever is ready. Returns false once
    // stop() was requested.
    bool run_once(Millis max_wait = Millis(100));

    void run();

    // Async-signal-safe.
    void stop() noexcept { stop_requested_.store(true); }
    bool stopped() const noexcept { return stop_requested_.load(); }

private:
    struct Task {
        std::string name;
        Step step;
        Clock::time_point due;
        bool cancelled = false;
        bool running = false;
    };
    struct Watch {
        int fd;
        std::function<void()> on_ready;
    };

    void run_due_tasks();

    std::map<TaskId, Task> tasks_;
    std::map<WatchId, Watch> watches_;
    TaskId next_task_id_ = 1;
    WatchId next_watch_id_ = 1;
    std::atomic<bool> stop_requested_{false};
};
