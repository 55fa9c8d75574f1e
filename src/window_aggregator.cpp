#include "window_aggregator.hpp"
#include "util_log.hpp"
#include <algorithm>
#include <cmath>

WindowAggregator::WindowAggregator(uint64_t window_ms,
                                   double start_time,
                                   std::unordered_set<std::string> tracked_methods,
                                   bool track_all_methods)
    : window_s(static_cast<double>(window_ms) / 1000.0),
      last_flush(start_time),
      tracked(std::move(tracked_methods)),
      track_all(track_all_methods || tracked.empty())
{
    safe_log(std::string("WindowAggregator: window_ms=") + std::to_string(window_ms)
             + " tracked=" + (track_all ? std::string("*") : std::to_string(tracked.size()) + " methods"));
}

bool WindowAggregator::tracks(const std::string &method) const {
    return track_all || tracked.count(method) > 0;
}

bool WindowAggregator::flush_due(double now) const noexcept {
    return now - last_flush >= window_s;
}

uint64_t WindowAggregator::window_ms() const noexcept {
    return static_cast<uint64_t>(std::llround(window_s * 1000.0));
}

std::vector<FlushedWindow> WindowAggregator::add(const Event &ev, double now) {
    total_events += 1;
    if (!tracks(ev.method)) {
        ignored_events += 1;
        return {};
    }

    windows[ev.method].add(ev.latency_ms, ev.is_error());

    if (!flush_due(now)) return {};
    return flush(now);
}

std::vector<FlushedWindow> WindowAggregator::flush(double now) {
    std::vector<FlushedWindow> out;
    out.reserve(windows.size());
    for (const auto &kv : windows) {
        out.push_back(FlushedWindow{kv.first, kv.second.snapshot()});
    }
    // stable order for consumers and tests
    std::sort(out.begin(), out.end(),
              [](const FlushedWindow &a, const FlushedWindow &b) { return a.method < b.method; });

    windows.clear();
    last_flush = now;
    flush_count += 1;
    return out;
}

const WindowStats *WindowAggregator::window(const std::string &method) const {
    auto it = windows.find(method);
    return it == windows.end() ? nullptr : &it->second;
}
