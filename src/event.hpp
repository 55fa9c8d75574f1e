#pragma once
#include <optional>
#include <string>

// One decoded RPC call-log line. Lives only until WindowAggregator::add()
// has folded it into the per-method statistics.
struct Event {
    double time = 0.0;                     // unix seconds (receive time if the line had none)
    std::optional<std::string> source_id;  // hashed ip, absent when the line carried no ip
    std::string method;
    double latency_ms = 0.0;
    int status_code = 200;

    bool is_error() const noexcept { return status_code >= 500; }
};
