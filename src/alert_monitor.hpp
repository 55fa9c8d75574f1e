#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

#include "classifier.hpp"

struct MonitorOptions {
    bool color = true;
    bool verbose = false;   // also print non-malicious traffic
};

// Console view of the bus: one {"ts","topic","data"} line per message.
class AlertMonitor {
public:
    AlertMonitor(const AnomalyClassifier &classifier, MonitorOptions opts, std::ostream &out);

    // True when the line was printed.
    bool handle(const std::string &topic, const std::string &payload, double now);

    bool is_malicious(const std::string &topic, const nlohmann::json &data) const;
    std::string render(const std::string &topic, const nlohmann::json &data, bool malicious, double now) const;

    uint64_t shown() const noexcept { return n_shown; }

private:
    const AnomalyClassifier &classifier;
    MonitorOptions opts;
    std::ostream &out;
    uint64_t n_shown = 0;
};
