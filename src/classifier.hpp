#pragma once
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "alert.hpp"
#include "window_stats.hpp"

struct TriggerThresholds {
    double z_latency = 3.0;
    double z_error = 3.0;
    double p95_ms = 250.0;
    double error_rate = 0.05;
};

// What the category rules look at; built from a flushed window or a decoded alert.
struct ClassifierInput {
    std::string method;
    uint64_t volume = 0;
    double error_rate = 0.0;
    double p95 = 0.0;
    double z_latency = 0.0;
    double z_error = 0.0;
};

enum class Severity { Low, Medium, High, Critical };

struct Classification {
    std::string type;
    Severity severity = Severity::Low;
    double confidence = 0.0;
    std::string recommended_action;
    std::vector<std::string> indicators;
};

const char *severity_name(Severity s);
int severity_score(Severity s);

ClassifierInput input_from_alert(const Alert &a);
ClassifierInput input_from_snapshot(const std::string &method, const WindowSnapshot &s);

class AnomalyClassifier {
public:
    AnomalyClassifier(TriggerThresholds thresholds, std::unordered_set<std::string> heavy_methods);

    // Four independent conditions joined by OR.
    bool should_trigger(const WindowSnapshot &s) const;
    bool should_trigger(double p95, double error_rate, double z_latency, double z_error) const;
    // The latency half (z_latency or p95) and the error half (z_error or error_rate).
    bool latency_trigger(double p95, double z_latency) const;
    bool error_trigger(double error_rate, double z_error) const;

    // Ordered rules, first match wins.
    Classification classify(const ClassifierInput &in) const;

    static bool should_auto_block(const Classification &c, double min_confidence = 0.7);
    static std::string format_report(const Classification &c);

    const TriggerThresholds &thresholds() const noexcept { return thr; }
    bool is_heavy(const std::string &method) const { return heavy.count(method) > 0; }

private:
    TriggerThresholds thr;
    std::unordered_set<std::string> heavy;
};
