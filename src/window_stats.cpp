#include "window_stats.hpp"
#include <algorithm>

WindowStats::WindowStats() : lat_ewma(kLatencyAlpha), err_ewma(kErrorAlpha) {}

void WindowStats::add(double latency_ms, bool is_error) {
    calls += 1;
    digest.add(latency_ms);
    lat_ewma.update(latency_ms);
    if (is_error) {
        errs += 1;
        err_ewma.update(1.0);
    } else {
        err_ewma.update(0.0);
    }
}

WindowSnapshot WindowStats::snapshot() const {
    WindowSnapshot s;
    s.sample_count = calls;
    s.error_count = errs;
    s.p95 = calls ? digest.quantile(0.95) : 0.0;
    s.error_rate = static_cast<double>(errs) / static_cast<double>(std::max<uint64_t>(1, calls));
    s.z_latency = lat_ewma.z(s.p95);
    s.z_error = err_ewma.z(s.error_rate);
    return s;
}
