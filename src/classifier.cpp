#include "classifier.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

const char *severity_name(Severity s) {
    switch (s) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "low";
}

int severity_score(Severity s) {
    switch (s) {
        case Severity::Low: return 1;
        case Severity::Medium: return 2;
        case Severity::High: return 3;
        case Severity::Critical: return 4;
    }
    return 0;
}

ClassifierInput input_from_alert(const Alert &a) {
    ClassifierInput in;
    in.method = a.method;
    in.volume = a.calls;
    in.error_rate = a.error_rate;
    in.p95 = a.p95;
    in.z_latency = a.z_latency;
    in.z_error = a.z_error;
    return in;
}

ClassifierInput input_from_snapshot(const std::string &method, const WindowSnapshot &s) {
    ClassifierInput in;
    in.method = method;
    in.volume = s.sample_count;
    in.error_rate = s.error_rate;
    in.p95 = s.p95;
    in.z_latency = s.z_latency;
    in.z_error = s.z_error;
    return in;
}

static std::string fmt(const char *pattern, double v) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), pattern, v);
    return buf;
}

static std::string percent(double rate) {
    return fmt("%.2f%%", rate * 100.0);
}

static bool contains_ci(const std::string &haystack, const std::string &needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

AnomalyClassifier::AnomalyClassifier(TriggerThresholds thresholds, std::unordered_set<std::string> heavy_methods)
    : thr(thresholds), heavy(std::move(heavy_methods)) {}

bool AnomalyClassifier::latency_trigger(double p95, double z_latency) const {
    return z_latency >= thr.z_latency || p95 >= thr.p95_ms;
}

bool AnomalyClassifier::error_trigger(double error_rate, double z_error) const {
    return z_error >= thr.z_error || error_rate >= thr.error_rate;
}

bool AnomalyClassifier::should_trigger(double p95, double error_rate, double z_latency, double z_error) const {
    return latency_trigger(p95, z_latency) || error_trigger(error_rate, z_error);
}

bool AnomalyClassifier::should_trigger(const WindowSnapshot &s) const {
    return should_trigger(s.p95, s.error_rate, s.z_latency, s.z_error);
}

Classification AnomalyClassifier::classify(const ClassifierInput &in) const {
    Classification c;
    const std::string volume = std::to_string(in.volume);

    if (in.volume > 1000 && in.error_rate < 0.15) {
        c.type = "ddos";
        c.severity = in.volume >= 5000 ? Severity::Critical : Severity::High;
        c.confidence = 0.90;
        c.recommended_action = "block_immediately";
        c.indicators.push_back("High volume: " + volume + " requests");
        c.indicators.push_back("Low error rate: " + percent(in.error_rate));
        return c;
    }

    if (is_heavy(in.method) && (in.z_latency > 4.0 || in.p95 > 500.0)) {
        c.type = "resource_exhaustion";
        c.severity = Severity::High;
        c.confidence = 0.85;
        c.recommended_action = "rate_limit_heavy_methods";
        c.indicators.push_back("Heavy method: " + in.method);
        c.indicators.push_back(fmt("High latency: p95=%.0fms", in.p95) + fmt(", z=%.1f", in.z_latency));
        return c;
    }

    if (in.error_rate > 0.30) {
        c.type = "scanning";
        c.severity = in.error_rate < 0.50 ? Severity::Medium : Severity::High;
        c.confidence = 0.80;
        c.recommended_action = "block_temporary";
        c.indicators.push_back("High error rate: " + percent(in.error_rate));
        c.indicators.push_back(fmt("Error z-score: %.1f", in.z_error));
        return c;
    }

    if (contains_ci(in.method, "auth") && in.error_rate > 0.50) {
        c.type = "credential_stuffing";
        c.severity = Severity::High;
        c.confidence = 0.75;
        c.recommended_action = "block_and_alert";
        c.indicators.push_back("Auth method: " + in.method);
        c.indicators.push_back("High failure rate: " + percent(in.error_rate));
        return c;
    }

    if (in.volume > 500 && in.error_rate > 0.05 && in.error_rate < 0.30) {
        c.type = "rate_abuse";
        c.severity = Severity::Medium;
        c.confidence = 0.70;
        c.recommended_action = "rate_limit";
        c.indicators.push_back("Moderate volume: " + volume + " requests");
        c.indicators.push_back("Moderate errors: " + percent(in.error_rate));
        return c;
    }

    c.type = "unknown";
    c.severity = Severity::Low;
    c.confidence = 0.50;
    c.recommended_action = "monitor";
    c.indicators.push_back("Requests: " + volume);
    c.indicators.push_back("Error rate: " + percent(in.error_rate));
    c.indicators.push_back(fmt("P95 latency: %.0fms", in.p95));
    return c;
}

bool AnomalyClassifier::should_auto_block(const Classification &c, double min_confidence) {
    if (c.confidence < min_confidence) return false;
    return c.severity == Severity::High || c.severity == Severity::Critical;
}

std::string AnomalyClassifier::format_report(const Classification &c) {
    std::string type = c.type;
    std::string sev = severity_name(c.severity);
    std::transform(type.begin(), type.end(), type.begin(), [](unsigned char ch) { return std::toupper(ch); });
    std::transform(sev.begin(), sev.end(), sev.begin(), [](unsigned char ch) { return std::toupper(ch); });

    std::ostringstream os;
    os << "Attack Type: " << type << "\n"
       << "Severity: " << sev << "\n"
       << "Confidence: " << static_cast<int>(std::lround(c.confidence * 100.0)) << "%\n"
       << "Recommended Action: " << c.recommended_action << "\n"
       << "\n"
       << "Indicators:";
    for (const auto &ind : c.indicators) os << "\n  - " << ind;
    return os.str();
}
