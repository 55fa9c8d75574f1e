#include "alert.hpp"
#include "numeric.hpp"
#include <cmath>

using json = nlohmann::json;

double round_to(double v, int decimals) {
    if (!std::isfinite(v)) return 0.0;
    double scale = std::pow(10.0, decimals);
    return std::round(v * scale) / scale;
}

Alert make_alert(const FlushedWindow &w,
                 int64_t ts,
                 uint64_t window_ms,
                 const std::string &region,
                 int64_t asn,
                 const std::optional<std::string> &sample) {
    Alert a;
    a.ts = ts;
    a.window_ms = window_ms;
    a.region = region;
    a.asn = asn;
    a.method = w.method;
    a.p95 = w.snapshot.p95;
    a.error_rate = w.snapshot.error_rate;
    a.calls = w.snapshot.sample_count;
    a.z_latency = w.snapshot.z_latency;
    a.z_error = w.snapshot.z_error;
    a.sample = sample;
    return a;
}

json alert_to_json(const Alert &a) {
    json j;
    j["ts"] = a.ts;
    j["window_ms"] = a.window_ms;
    j["region"] = a.region;
    j["asn"] = a.asn;
    j["method"] = a.method;
    j["metrics"] = {
        {"p95", round_to(a.p95, 2)},
        {"err_rate", round_to(a.error_rate, 4)},
        {"calls", a.calls},
    };
    j["z"] = {
        {"lat", round_to(a.z_latency, 2)},
        {"err", round_to(a.z_error, 2)},
    };
    if (a.sample) j["sample"] = *a.sample;
    else j["sample"] = nullptr;
    return j;
}

std::string encode_alert(const Alert &a) {
    return alert_to_json(a).dump(-1, ' ', false, json::error_handler_t::replace);
}

// Out-of-range values (negative counts, 1e300 timestamps) fall back too.
template <typename T>
static T integer_or(const json &obj, const char *key, T fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    return json_integral<T>(*it).value_or(fallback);
}

static double number_or(const json &obj, const char *key, double fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return fallback;
    double d = it->get<double>();
    return std::isfinite(d) ? d : fallback;
}

static std::string string_or(const json &obj, const char *key, const std::string &fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::optional<Alert> alert_from_json(const json &j) {
    if (!j.is_object()) return std::nullopt;
    Alert a;
    a.ts = integer_or<int64_t>(j, "ts", 0);
    a.window_ms = integer_or<uint64_t>(j, "window_ms", 0);
    a.region = string_or(j, "region", "");
    a.asn = integer_or<int64_t>(j, "asn", 0);
    a.method = string_or(j, "method", "");

    auto mit = j.find("metrics");
    if (mit != j.end() && mit->is_object()) {
        a.p95 = number_or(*mit, "p95", 0.0);
        a.error_rate = number_or(*mit, "err_rate", 0.0);
        a.calls = integer_or<uint64_t>(*mit, "calls", 0);
    }
    auto zit = j.find("z");
    if (zit != j.end() && zit->is_object()) {
        a.z_latency = number_or(*zit, "lat", 0.0);
        a.z_error = number_or(*zit, "err", 0.0);
    }
    auto sit = j.find("sample");
    if (sit != j.end() && sit->is_string()) a.sample = sit->get<std::string>();
    return a;
}

std::optional<Alert> decode_alert(const std::string &payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    return alert_from_json(j);
}

std::string encode_heartbeat(const Heartbeat &h) {
    json j;
    j["ts"] = h.ts;
    j["region"] = h.region;
    j["asn"] = h.asn;
    j["status"] = h.status;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
