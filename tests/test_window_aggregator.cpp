// tests/test_window_aggregator.cpp
#include <iostream>
#include <string>
#include "../src/window_aggregator.hpp"

static Event ev(const std::string &method, double lat, int status = 200) {
    Event e;
    e.method = method;
    e.latency_ms = lat;
    e.status_code = status;
    return e;
}

int main() {
    const double t0 = 1000.0;
    WindowAggregator agg(250, t0);

    if (!agg.add(ev("getLogs", 10), t0 + 0.05).empty()) {
        std::cerr << "flush before the window elapsed\n";
        return 2;
    }
    agg.add(ev("getLogs", 20, 500), t0 + 0.10);
    agg.add(ev("getSlot", 5), t0 + 0.20);

    const WindowStats *w = agg.window("getLogs");
    if (!w || w->sample_count() != 2 || w->error_count() != 1) {
        std::cerr << "getLogs window wrong\n";
        return 3;
    }
    if (agg.active_methods() != 2) {
        std::cerr << "expected 2 active methods\n";
        return 4;
    }

    // the event that crosses the boundary is counted, then every method flushes
    auto flushed = agg.add(ev("getSlot", 7), t0 + 0.25);
    if (flushed.size() != 2 || flushed[0].method != "getLogs" || flushed[1].method != "getSlot") {
        std::cerr << "expected a batch flush of both methods, got " << flushed.size() << "\n";
        return 5;
    }
    if (flushed[0].snapshot.sample_count != 2 || flushed[0].snapshot.error_rate != 0.5 ||
        flushed[1].snapshot.sample_count != 2) {
        std::cerr << "flushed snapshots wrong\n";
        return 6;
    }

    // tumbling: nothing survives the flush
    if (agg.window("getLogs") || agg.window("getSlot") || agg.active_methods() != 0) {
        std::cerr << "stale window visible after flush\n";
        return 7;
    }
    if (agg.last_flush_time() != t0 + 0.25 || agg.get_flushes() != 1) {
        std::cerr << "last flush time not advanced\n";
        return 8;
    }

    agg.add(ev("getLogs", 99), t0 + 0.30);
    const WindowStats *fresh = agg.window("getLogs");
    if (!fresh || fresh->sample_count() != 1) {
        std::cerr << "new window should start from scratch\n";
        return 9;
    }
    if (agg.flush_due(t0 + 0.40) || !agg.flush_due(t0 + 0.50)) {
        std::cerr << "flush_due boundary wrong\n";
        return 10;
    }

    // only the tracked set unless all-method tracking is on
    WindowAggregator heavy(250, t0, {"getProgramAccounts"}, false);
    heavy.add(ev("getSlot", 1), t0 + 0.01);
    heavy.add(ev("getProgramAccounts", 1), t0 + 0.02);
    if (heavy.window("getSlot") || !heavy.window("getProgramAccounts") || heavy.get_ignored() != 1 ||
        heavy.get_total() != 2) {
        std::cerr << "untracked method not ignored\n";
        return 11;
    }
    // an ignored event does not drive the flush
    if (!heavy.add(ev("getSlot", 1), t0 + 5.0).empty() || heavy.get_flushes() != 0) {
        std::cerr << "ignored event flushed the window\n";
        return 12;
    }
    if (!heavy.tracks("getProgramAccounts") || heavy.tracks("getSlot")) {
        std::cerr << "tracks() wrong\n";
        return 13;
    }

    std::cout << "test_window_aggregator: OK\n";
    return 0;
}
