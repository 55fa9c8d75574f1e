// tests/test_event_loop.cpp
#include <iostream>
#include <stdexcept>
#include <string>
#include <optional>
#include <vector>
#include <unistd.h>
#include "../src/event_loop.hpp"

int main() {
    using Millis = EventLoop::Millis;
    EventLoop loop;
    std::vector<std::string> order;

    int ticks = 0;
    auto every = loop.every("tick", Millis(1), [&] { ticks += 1; }, true);
    int countdown = 3;
    loop.schedule("countdown", [&]() -> std::optional<Millis> {
        order.push_back("countdown");
        if (--countdown == 0) return std::nullopt;
        return Millis(0);
    });

    for (int i = 0; i < 20; ++i) loop.run_once(Millis(2));
    if (countdown != 0 || order.size() != 3) {
        std::cerr << "finite task should run exactly 3 times, ran " << order.size() << "\n";
        return 2;
    }
    if (ticks < 2) {
        std::cerr << "periodic task did not repeat\n";
        return 3;
    }
    if (loop.task_count() != 1 || !loop.is_active(every)) {
        std::cerr << "finished task not removed\n";
        return 4;
    }
    if (!loop.cancel(every) || loop.is_active(every) || loop.cancel(every) || loop.task_count() != 0) {
        std::cerr << "cancel wrong\n";
        return 5;
    }

    // a task due in 10 ms fires after a couple of 5 ms passes, not hundreds
    bool fired = false;
    loop.schedule("delayed", [&]() -> std::optional<Millis> {
        fired = true;
        return std::nullopt;
    }, Millis(10));
    int passes = 0;
    while (!fired && passes < 6) {
        loop.run_once(Millis(5));
        passes += 1;
    }
    if (!fired || passes > 4) {
        std::cerr << "delayed task took " << passes << " passes\n";
        return 15;
    }

    // a task may cancel another one, and itself, while running
    int victim_runs = 0, self_runs = 0;
    EventLoop::TaskId victim = loop.schedule("victim", [&]() -> std::optional<Millis> {
        victim_runs += 1;
        return Millis(0);
    }, Millis(5));
    EventLoop::TaskId self = 0;
    self = loop.schedule("killer", [&]() -> std::optional<Millis> {
        self_runs += 1;
        loop.cancel(victim);
        loop.cancel(self);
        return Millis(0);
    });
    for (int i = 0; i < 5; ++i) loop.run_once(Millis(2));
    if (victim_runs != 0 || self_runs != 1 || loop.task_count() != 0) {
        std::cerr << "cancellation from inside a step failed\n";
        return 6;
    }

    // a throwing step is kept and retried later
    int throws = 0;
    auto thrower = loop.schedule("thrower", [&]() -> std::optional<Millis> {
        throws += 1;
        throw std::runtime_error("boom");
    });
    loop.run_once(Millis(0));
    if (throws != 1 || !loop.is_active(thrower)) {
        std::cerr << "failing task should stay scheduled\n";
        return 7;
    }
    loop.cancel(thrower);

    // readiness of a watched descriptor
    int fds[2];
    if (pipe(fds) != 0) {
        std::cerr << "pipe failed\n";
        return 8;
    }
    int readable = 0;
    auto w = loop.watch_readable(fds[0], [&] {
        char c;
        if (read(fds[0], &c, 1) == 1) readable += 1;
    });
    loop.run_once(Millis(1));
    if (readable != 0) {
        std::cerr << "callback without data\n";
        return 9;
    }
    if (write(fds[1], "x", 1) != 1) return 10;
    loop.run_once(Millis(100));
    if (readable != 1) {
        std::cerr << "readable callback not invoked\n";
        return 11;
    }
    loop.unwatch(w);
    if (write(fds[1], "y", 1) != 1) return 12;
    loop.run_once(Millis(1));
    if (readable != 1) {
        std::cerr << "unwatched fd still dispatched\n";
        return 13;
    }
    close(fds[0]);
    close(fds[1]);

    // stop() ends run()
    loop.schedule("stopper", [&]() -> std::optional<Millis> {
        loop.stop();
        return std::nullopt;
    }, Millis(3));
    loop.run();
    if (!loop.stopped() || loop.run_once()) {
        std::cerr << "stop did not end the loop\n";
        return 14;
    }

    std::cout << "test_event_loop: OK\n";
    return 0;
}
