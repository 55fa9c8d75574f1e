#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include "rotating_writer.hpp"

extern const char *const kTopicAlert;       // sentinel/diag
extern const char *const kTopicHealth;      // sentinel/health
extern const char *const kTopicAll;         // sentinel/#
extern const char *const kFlaggedTopicPrefix;  // sentinel/alert

// Payload as a JSON value; text that is not JSON becomes {"raw": text}.
nlohmann::json payload_to_json(const std::string &payload);

// Numeric "ts" of the payload, or `now`.
double payload_timestamp(const nlohmann::json &data, double now);

// Routes every bus message into the normal or the flagged writer.
class PersistenceSink {
public:
    enum class Route { Normal, Flagged, Failed };

    PersistenceSink(RotatingWriter &normal, RotatingWriter &flagged, double z_threshold);

    Route handle(const std::string &topic, const std::string &payload, double now);

    // sentinel/alert* topics, or a z.lat / z.err at or above the threshold
    bool is_flagged(const std::string &topic, const nlohmann::json &data) const;

    uint64_t normal_count() const noexcept { return n_normal; }
    uint64_t flagged_count() const noexcept { return n_flagged; }
    uint64_t failed_count() const noexcept { return n_failed; }

private:
    RotatingWriter &normal;
    RotatingWriter &flagged;
    double z_thresh;
    uint64_t n_normal = 0;
    uint64_t n_flagged = 0;
    uint64_t n_failed = 0;
};
