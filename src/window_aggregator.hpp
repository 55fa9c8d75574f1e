#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "event.hpp"
#include "window_stats.hpp"

struct FlushedWindow {
    std::string method;
    WindowSnapshot snapshot;
};

// Per-method tumbling windows. Every method is flushed on the same tick and
// the whole mapping is cleared, so nothing carries over into the next window.
class WindowAggregator {
    std::unordered_map<std::string, WindowStats> windows;
    double window_s;
    double last_flush;

    std::unordered_set<std::string> tracked;
    bool track_all;

    uint64_t total_events = 0;
    uint64_t ignored_events = 0;
    uint64_t flush_count = 0;

public:
    // window_ms: tumbling window length; start_time: initial last_flush (unix seconds).
    // Only methods in tracked_methods are aggregated unless track_all_methods is set.
    WindowAggregator(uint64_t window_ms,
                     double start_time,
                     std::unordered_set<std::string> tracked_methods = {},
                     bool track_all_methods = true);

    // Fold ev into its method's window, then flush if the window elapsed.
    // Returns the flushed windows (empty when no tick happened or the event
    // was ignored).
    std::vector<FlushedWindow> add(const Event &ev, double now);

    // Unconditional batch flush; last_flush := now.
    std::vector<FlushedWindow> flush(double now);

    bool flush_due(double now) const noexcept;
    bool tracks(const std::string &method) const;

    // nullptr means no data for the method in the current window.
    const WindowStats *window(const std::string &method) const;

    size_t active_methods() const noexcept { return windows.size(); }
    uint64_t window_ms() const noexcept;
    double last_flush_time() const noexcept { return last_flush; }
    uint64_t get_total() const noexcept { return total_events; }
    uint64_t get_ignored() const noexcept { return ignored_events; }
    uint64_t get_flushes() const noexcept { return flush_count; }
};
