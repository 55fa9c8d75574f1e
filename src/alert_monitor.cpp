#include "alert_monitor.hpp"
#include "persistence_sink.hpp"

#include <cmath>

using json = nlohmann::json;

namespace {

const char *const kRed = "\033[1;31m";
const char *const kGreen = "\033[1;32m";
const char *const kCyan = "\033[36m";
const char *const kDim = "\033[2m";
const char *const kReset = "\033[0m";

double number_at(const json &data, const char *group, const char *key) {
    if (!data.is_object()) return 0.0;
    auto g = data.find(group);
    if (g == data.end() || !g->is_object()) return 0.0;
    auto v = g->find(key);
    if (v == g->end() || !v->is_number()) return 0.0;
    return v->get<double>();
}

}

AlertMonitor::AlertMonitor(const AnomalyClassifier &c, MonitorOptions o, std::ostream &os)
    : classifier(c), opts(o), out(os) {}

bool AlertMonitor::is_malicious(const std::string &topic, const json &data) const {
    if (topic.rfind(kFlaggedTopicPrefix, 0) == 0) return true;
    return classifier.should_trigger(number_at(data, "metrics", "p95"),
                                     number_at(data, "metrics", "err_rate"),
                                     number_at(data, "z", "lat"),
                                     number_at(data, "z", "err"));
}

std::string AlertMonitor::render(const std::string &topic, const json &data, bool malicious, double now) const {
    double ts = payload_timestamp(data, now);
    json line;
    line["ts"] = static_cast<int64_t>(std::trunc(ts));
    line["topic"] = topic;
    line["data"] = data;
    std::string text = line.dump(-1, ' ', false, json::error_handler_t::replace);
    if (!opts.color) return text;
    if (malicious) return kRed + text + kReset;
    if (topic.rfind(kTopicHealth, 0) == 0) return std::string(kDim) + kGreen + text + kReset;
    return kCyan + text + kReset;
}

bool AlertMonitor::handle(const std::string &topic, const std::string &payload, double now) {
    json data = payload_to_json(payload);
    bool mal = is_malicious(topic, data);
    if (!mal && !opts.verbose) return false;
    out << render(topic, data, mal, now) << std::endl;
    n_shown += 1;
    return true;
}
