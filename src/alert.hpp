#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "window_aggregator.hpp"

// Published once per triggering method per flush tick.
struct Alert {
    int64_t ts = 0;
    uint64_t window_ms = 0;
    std::string region;
    int64_t asn = 0;
    std::string method;
    double p95 = 0.0;
    double error_rate = 0.0;
    uint64_t calls = 0;
    double z_latency = 0.0;
    double z_error = 0.0;
    std::optional<std::string> sample;  // hashed source of the event that closed the window
};

struct Heartbeat {
    int64_t ts = 0;
    std::string region;
    int64_t asn = 0;
    std::string status = "ok";
};

Alert make_alert(const FlushedWindow &w,
                 int64_t ts,
                 uint64_t window_ms,
                 const std::string &region,
                 int64_t asn,
                 const std::optional<std::string> &sample);

// Wire format:
// {"ts","window_ms","region","asn","method","metrics":{"p95","err_rate","calls"},
//  "z":{"lat","err"},"sample":<string|null>}
// p95 and z are rounded to 2 decimals, err_rate to 4.
nlohmann::json alert_to_json(const Alert &a);
std::string encode_alert(const Alert &a);

// Tolerant decode: absent or mistyped fields keep their defaults (0, "" or
// no sample). Only a payload that is not a JSON object is rejected.
std::optional<Alert> alert_from_json(const nlohmann::json &j);
std::optional<Alert> decode_alert(const std::string &payload);

std::string encode_heartbeat(const Heartbeat &h);

double round_to(double v, int decimals);
