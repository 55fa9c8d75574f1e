#include "persistence_sink.hpp"
#include "numeric.hpp"

#include <cmath>

const char *const kTopicAlert = "sentinel/diag";
const char *const kTopicHealth = "sentinel/health";
const char *const kTopicAll = "sentinel/#";
const char *const kFlaggedTopicPrefix = "sentinel/alert";

using json = nlohmann::json;

json payload_to_json(const std::string &payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded()) return json{{"raw", payload}};
    return j;
}

double payload_timestamp(const json &data, double now) {
    if (data.is_object()) {
        auto it = data.find("ts");
        if (it != data.end() && it->is_number()) {
            double ts = it->get<double>();
            // unusable timestamps (1e300, NaN) fall back to the receive time
            if (to_integral<int64_t>(std::floor(ts))) return ts;
        }
    }
    return now;
}

static double z_field(const json &data, const char *key) {
    if (!data.is_object()) return 0.0;
    auto z = data.find("z");
    if (z == data.end() || !z->is_object()) return 0.0;
    auto v = z->find(key);
    if (v == z->end() || !v->is_number()) return 0.0;
    return v->get<double>();
}

PersistenceSink::PersistenceSink(RotatingWriter &normal_writer, RotatingWriter &flagged_writer, double z_threshold)
    : normal(normal_writer), flagged(flagged_writer), z_thresh(z_threshold) {}

bool PersistenceSink::is_flagged(const std::string &topic, const json &data) const {
    if (topic.rfind(kFlaggedTopicPrefix, 0) == 0) return true;
    return z_field(data, "lat") >= z_thresh || z_field(data, "err") >= z_thresh;
}

PersistenceSink::Route PersistenceSink::handle(const std::string &topic, const std::string &payload, double now) {
    json data = payload_to_json(payload);
    double ts = payload_timestamp(data, now);

    if (is_flagged(topic, data)) {
        if (flagged.write(data, ts)) {
            n_flagged += 1;
            return Route::Flagged;
        }
    } else if (normal.write(data, ts)) {
        n_normal += 1;
        return Route::Normal;
    }
    n_failed += 1;
    return Route::Failed;
}
