#pragma once
#include <cstdint>
#include "ewma.hpp"
#include "tdigest.hpp"

struct WindowSnapshot {
    double p95 = 0.0;
    double error_rate = 0.0;
    double z_latency = 0.0;
    double z_error = 0.0;
    uint64_t sample_count = 0;
    uint64_t error_count = 0;
};

// Online statistics of one method inside one tumbling window.
// Invariant: sample_count >= error_count; every add() feeds the sketch and
// both EWMAs before returning.
class WindowStats {
public:
    static constexpr double kLatencyAlpha = 0.15;
    static constexpr double kErrorAlpha = 0.10;

    WindowStats();

    void add(double latency_ms, bool is_error);

    // Side-effect free; two calls without an add() in between are identical.
    WindowSnapshot snapshot() const;

    uint64_t sample_count() const noexcept { return calls; }
    uint64_t error_count() const noexcept { return errs; }
    const Ewma &latency_ewma() const noexcept { return lat_ewma; }
    const Ewma &error_ewma() const noexcept { return err_ewma; }
    const TDigest &latency_sketch() const noexcept { return digest; }

private:
    TDigest digest;
    uint64_t calls = 0;
    uint64_t errs = 0;
    Ewma lat_ewma;
    Ewma err_ewma;
};
