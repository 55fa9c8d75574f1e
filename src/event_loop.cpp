#include "event_loop.hpp"
#include "util_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <vector>
#include <poll.h>

// a step that throws is retried after this delay
static const EventLoop::Millis kFailedStepRetry{1000};

EventLoop::TaskId EventLoop::schedule(std::string name, Step step, Millis first_delay) {
    TaskId id = next_task_id_++;
    Task t;
    t.name = std::move(name);
    t.step = std::move(step);
    t.due = Clock::now() + first_delay;
    tasks_.emplace(id, std::move(t));
    return id;
}

EventLoop::TaskId EventLoop::every(std::string name, Millis interval, std::function<void()> fn, bool run_now) {
    return schedule(std::move(name),
                    [fn = std::move(fn), interval]() -> std::optional<Millis> {
                        fn();
                        return interval;
                    },
                    run_now ? Millis(0) : interval);
}

bool EventLoop::cancel(TaskId id) {
    auto it = tasks_.find(id);
    if (it == tasks_.end() || it->second.cancelled) return false;
    it->second.cancelled = true;
    // a running step is erased by run_due_tasks once it returns
    if (!it->second.running) tasks_.erase(it);
    return true;
}

bool EventLoop::is_active(TaskId id) const {
    auto it = tasks_.find(id);
    return it != tasks_.end() && !it->second.cancelled;
}

size_t EventLoop::task_count() const {
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
                                             [](const auto &kv) { return !kv.second.cancelled; }));
}

EventLoop::WatchId EventLoop::watch_readable(int fd, std::function<void()> on_ready) {
    WatchId id = next_watch_id_++;
    watches_.emplace(id, Watch{fd, std::move(on_ready)});
    return id;
}

void EventLoop::unwatch(WatchId id) {
    watches_.erase(id);
}

void EventLoop::run_due_tasks() {
    const auto now = Clock::now();
    std::vector<TaskId> due;
    for (const auto &kv : tasks_) {
        if (!kv.second.cancelled && kv.second.due <= now) due.push_back(kv.first);
    }

    for (TaskId id : due) {
        auto it = tasks_.find(id);
        if (it == tasks_.end() || it->second.cancelled) continue;

        it->second.running = true;
        Step step = std::move(it->second.step);
        std::optional<Millis> next;
        try {
            next = step();
        } catch (const std::exception &e) {
            safe_log("EventLoop: task '" + it->second.name + "' failed: " + e.what());
            next = kFailedStepRetry;
        }

        // the step may have scheduled or cancelled tasks; look it up again
        it = tasks_.find(id);
        if (it == tasks_.end()) continue;
        it->second.running = false;
        if (it->second.cancelled || !next) {
            tasks_.erase(it);
            continue;
        }
        it->second.step = std::move(step);
        it->second.due = Clock::now() + *next;
    }
}

bool EventLoop::run_once(Millis max_wait) {
    if (stopped()) return false;

    auto wait = max_wait;
    const auto now = Clock::now();
    for (const auto &kv : tasks_) {
        if (kv.second.cancelled) continue;
        // round up so a task due in under 1 ms still blocks poll instead of spinning
        auto until = std::chrono::ceil<Millis>(kv.second.due - now);
        if (until < wait) wait = until;
    }
    if (wait < Millis(0)) wait = Millis(0);

    std::vector<pollfd> fds;
    std::vector<WatchId> ids;
    fds.reserve(watches_.size());
    for (const auto &kv : watches_) {
        pollfd p{};
        p.fd = kv.second.fd;
        p.events = POLLIN;
        fds.push_back(p);
        ids.push_back(kv.first);
    }

    int rc = ::poll(fds.empty() ? nullptr : fds.data(), static_cast<nfds_t>(fds.size()),
                    static_cast<int>(wait.count()));
    if (rc < 0 && errno != EINTR) {
        safe_log(std::string("EventLoop: poll failed: ") + std::strerror(errno));
    }

    if (rc > 0) {
        for (size_t i = 0; i < fds.size(); ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            // an earlier callback may have removed this watch
            auto it = watches_.find(ids[i]);
            if (it == watches_.end()) continue;
            auto cb = it->second.on_ready;
            try {
                cb();
            } catch (const std::exception &e) {
                safe_log(std::string("EventLoop: socket callback failed: ") + e.what());
            }
        }
    }

    run_due_tasks();
    return !stopped();
}

void EventLoop::run() {
    safe_log("EventLoop: running");
    while (run_once()) {
    }
    safe_log("EventLoop: stopped");
}
