#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "alert.hpp"
#include "classifier.hpp"
#include "firewall.hpp"

struct ResponseOptions {
    bool auto_block = false;
    bool dry_run = false;
    double min_confidence = 0.75;
    std::string actions_log = "/data/actions.log";   // empty: no audit log
};

struct ResponseOutcome {
    Classification classification;
    bool executed = false;   // recommended action carried out (not in dry-run)
    bool blocked = false;    // a source went to the firewall
};

nlohmann::json classification_to_json(const Classification &c);

// Classifies published alerts and carries out the recommended action.
class ResponseHandler {
public:
    ResponseHandler(const AnomalyClassifier &classifier, Firewall &firewall, ResponseOptions opts);

    // nullopt when the payload is not an alert or the classification is
    // below min_confidence.
    std::optional<ResponseOutcome> handle(const std::string &payload, double now);
    std::optional<ResponseOutcome> handle_alert(const Alert &alert, double now);

    const ResponseOptions &options() const noexcept { return opts; }
    uint64_t handled() const noexcept { return n_handled; }

private:
    ResponseOutcome execute(const Classification &c, const Alert &alert);
    bool block_sample(const Alert &alert, const std::string &reason);
    void log_action(const Classification &c, const Alert &alert, double now);

    const AnomalyClassifier &classifier;
    Firewall &firewall;
    ResponseOptions opts;
    uint64_t n_handled = 0;
};
