#include "response_handler.hpp"
#include "source_hash.hpp"
#include "util_log.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

json classification_to_json(const Classification &c) {
    return json{{"type", c.type},
                {"severity", severity_name(c.severity)},
                {"confidence", c.confidence},
                {"recommended_action", c.recommended_action},
                {"indicators", c.indicators}};
}

ResponseHandler::ResponseHandler(const AnomalyClassifier &c, Firewall &fw, ResponseOptions o)
    : classifier(c), firewall(fw), opts(std::move(o)) {
    safe_log(std::string("ResponseHandler: auto_block=") + (opts.auto_block ? "on" : "off") +
             " dry_run=" + (opts.dry_run ? "on" : "off") +
             " min_confidence=" + std::to_string(opts.min_confidence));
}

std::optional<ResponseOutcome> ResponseHandler::handle(const std::string &payload, double now) {
    auto alert = decode_alert(payload);
    if (!alert) {
        safe_log("ResponseHandler: payload is not an alert, ignored");
        return std::nullopt;
    }
    return handle_alert(*alert, now);
}

std::optional<ResponseOutcome> ResponseHandler::handle_alert(const Alert &alert, double now) {
    Classification c = classifier.classify(input_from_alert(alert));
    if (c.confidence < opts.min_confidence) return std::nullopt;

    n_handled += 1;
    safe_log("ResponseHandler: " + c.type + " on " + alert.method + ", severity " + severity_name(c.severity) +
             ", confidence " + std::to_string(static_cast<int>(std::lround(c.confidence * 100))) + "%");
    for (const auto &ind : c.indicators) safe_log("ResponseHandler:   - " + ind);

    ResponseOutcome outcome;
    if (opts.auto_block && AnomalyClassifier::should_auto_block(c, opts.min_confidence)) {
        outcome = execute(c, alert);
    } else {
        outcome.classification = c;
        safe_log("ResponseHandler: manual review required");
    }
    log_action(c, alert, now);
    return outcome;
}

bool ResponseHandler::block_sample(const Alert &alert, const std::string &reason) {
    if (!alert.sample || alert.sample->empty()) {
        safe_log("ResponseHandler: alert carries no sample source to block");
        return false;
    }
    std::string id = *alert.sample;
    if (id.rfind(kSourceHashPrefix, 0) == 0) id.erase(0, std::string(kSourceHashPrefix).size());
    return firewall.block(id, reason);
}

ResponseOutcome ResponseHandler::execute(const Classification &c, const Alert &alert) {
    ResponseOutcome r;
    r.classification = c;
    const std::string &action = c.recommended_action;

    if (opts.dry_run) {
        safe_log("ResponseHandler: [dry-run] would execute " + action);
        return r;
    }
    safe_log("ResponseHandler: executing " + action);
    r.executed = true;

    if (action == "block_immediately") {
        r.blocked = block_sample(alert, "ddos");
    } else if (action == "block_temporary") {
        r.blocked = block_sample(alert, "scanning, 3600s");
    } else if (action == "block_and_alert") {
        r.blocked = block_sample(alert, "credential_stuffing");
        safe_log("ResponseHandler: notify security team:\n" + AnomalyClassifier::format_report(c));
    } else if (action == "rate_limit_heavy_methods") {
        safe_log("ResponseHandler: rate limiting method " + alert.method);
    } else if (action == "rate_limit") {
        safe_log("ResponseHandler: applying rate limits");
    } else {
        safe_log("ResponseHandler: monitoring only");
    }
    return r;
}

void ResponseHandler::log_action(const Classification &c, const Alert &alert, double now) {
    if (opts.actions_log.empty()) return;

    json entry;
    entry["timestamp"] = static_cast<int64_t>(std::floor(now));
    entry["classification"] = classification_to_json(c);
    json a = alert_to_json(alert);
    entry["data"] = json{{"method", a["method"]},
                         {"region", a["region"]},
                         {"asn", a["asn"]},
                         {"metrics", a["metrics"]},
                         {"z", a["z"]}};
    entry["auto_block"] = opts.auto_block;
    entry["dry_run"] = opts.dry_run;

    fs::path p(opts.actions_log);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    std::ofstream out(opts.actions_log, std::ios::out | std::ios::app);
    if (!out) {
        safe_log("ResponseHandler: cannot open actions log " + opts.actions_log);
        return;
    }
    out << entry.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    out.flush();
    if (!out) safe_log("ResponseHandler: write to actions log failed");
}
