#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim(const std::string &s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

double to_double(const std::string &name, const std::string &v) {
    std::string t = trim(v);
    errno = 0;
    char *end = nullptr;
    double d = std::strtod(t.c_str(), &end);
    if (t.empty() || end != t.c_str() + t.size() || errno == ERANGE || !std::isfinite(d)) {
        throw std::invalid_argument(name + ": not a number: '" + v + "'");
    }
    return d;
}

int64_t to_int(const std::string &name, const std::string &v) {
    std::string t = trim(v);
    errno = 0;
    char *end = nullptr;
    long long n = std::strtoll(t.c_str(), &end, 10);
    if (t.empty() || end != t.c_str() + t.size() || errno == ERANGE) {
        throw std::invalid_argument(name + ": not an integer: '" + v + "'");
    }
    return static_cast<int64_t>(n);
}

bool to_bool(const std::string &name, const std::string &v) {
    std::string t = lower(trim(v));
    if (t == "1" || t == "true" || t == "yes" || t == "on") return true;
    if (t == "0" || t == "false" || t == "no" || t == "off") return false;
    throw std::invalid_argument(name + ": not a boolean: '" + v + "'");
}

std::unordered_set<std::string> to_set(const std::string &v) {
    std::unordered_set<std::string> out;
    std::stringstream ss(v);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.insert(item);
    }
    return out;
}

int64_t positive(const std::string &name, int64_t v) {
    if (v <= 0) throw std::invalid_argument(name + ": must be positive");
    return v;
}

int64_t non_negative(const std::string &name, int64_t v) {
    if (v < 0) throw std::invalid_argument(name + ": must not be negative");
    return v;
}

// One option: its flag, its environment variable, and how to store a value.
// `flag_only` options take no value on the command line.
struct Option {
    const char *flag;
    const char *env;
    bool flag_only;
    std::function<void(Config &, const std::string &name, const std::string &value)> apply;
};

}

BrokerAddress parse_broker_url(const std::string &url) {
    std::string rest = trim(url);
    auto sep = rest.find("://");
    if (sep != std::string::npos) {
        std::string scheme = lower(rest.substr(0, sep));
        if (scheme != "mqtt" && scheme != "tcp") {
            throw std::invalid_argument("broker: unsupported scheme '" + scheme + "'");
        }
        rest = rest.substr(sep + 3);
    }
    auto slash = rest.find('/');
    if (slash != std::string::npos) rest = rest.substr(0, slash);
    auto at = rest.rfind('@');
    if (at != std::string::npos) rest = rest.substr(at + 1);

    BrokerAddress b;
    auto colon = rest.rfind(':');
    if (colon != std::string::npos && rest.find(']') == std::string::npos) {
        std::string port = rest.substr(colon + 1);
        rest = rest.substr(0, colon);
        int64_t p = to_int("broker port", port);
        if (p <= 0 || p > 65535) throw std::invalid_argument("broker: port out of range: " + port);
        b.port = static_cast<uint16_t>(p);
    }
    if (!rest.empty() && rest.front() == '[' && rest.back() == ']') rest = rest.substr(1, rest.size() - 2);
    if (rest.empty()) throw std::invalid_argument("broker: missing host in '" + url + "'");
    b.host = rest;
    return b;
}

EnvLookup process_env() {
    return [](const std::string &name) -> std::optional<std::string> {
        const char *v = std::getenv(name.c_str());
        if (!v || !*v) return std::nullopt;
        return std::string(v);
    };
}

static const std::vector<Option> &options() {
    static const std::vector<Option> opts = {
        {"--broker", "MQTT_URL", false, [](Config &c, const std::string &, const std::string &v) {
            c.broker = parse_broker_url(v);
            c.broker_url = v;
        }},
        {"--log-path", "LOG_PATH", false, [](Config &c, const std::string &, const std::string &v) { c.log_path = v; }},
        {"--region", "REGION", false, [](Config &c, const std::string &, const std::string &v) { c.region = v; }},
        {"--asn", "ASN", false, [](Config &c, const std::string &n, const std::string &v) { c.asn = to_int(n, v); }},
        {"--window-ms", "WINDOW_MS", false, [](Config &c, const std::string &n, const std::string &v) {
            c.window_ms = static_cast<uint64_t>(positive(n, to_int(n, v)));
        }},
        {"--z-threshold", "Z_THRESHOLD", false, [](Config &c, const std::string &n, const std::string &v) { c.z_threshold = to_double(n, v); }},
        {"--zlat-thr", "ZLAT_THR", false, [](Config &c, const std::string &n, const std::string &v) { c.zlat_thr = to_double(n, v); }},
        {"--zerr-thr", "ZERR_THR", false, [](Config &c, const std::string &n, const std::string &v) { c.zerr_thr = to_double(n, v); }},
        {"--p95-thr", "P95_THR", false, [](Config &c, const std::string &n, const std::string &v) { c.p95_thr = to_double(n, v); }},
        {"--err-thr", "ERR_THR", false, [](Config &c, const std::string &n, const std::string &v) { c.err_thr = to_double(n, v); }},
        {"--salt", "SALT", false, [](Config &c, const std::string &, const std::string &v) { c.salt = v; }},
        {"--heavy-methods", "METHODS_HEAVY", false, [](Config &c, const std::string &, const std::string &v) { c.heavy_methods = to_set(v); }},
        {"--tracked-methods", "TRACKED_METHODS", false, [](Config &c, const std::string &, const std::string &v) { c.tracked_methods = to_set(v); }},
        {"--track-all-methods", "TRACK_ALL_METHODS", true, [](Config &c, const std::string &n, const std::string &v) { c.track_all_methods = to_bool(n, v); }},
        {"--no-saver", "EMBED_SAVER", true, [](Config &c, const std::string &n, const std::string &v) {
            // the flag turns the saver off, the variable states whether it is on
            c.saver = (n == "--no-saver") ? !to_bool(n, v) : to_bool(n, v);
        }},
        {"--normal-dir", "NORMAL_DIR", false, [](Config &c, const std::string &, const std::string &v) { c.normal_dir = v; }},
        {"--flagged-dir", "MALICIOUS_DIR", false, [](Config &c, const std::string &, const std::string &v) { c.flagged_dir = v; }},
        {"--normal-rotate-secs", "NORMAL_ROTATE_SECS", false, [](Config &c, const std::string &n, const std::string &v) {
            c.normal_rotate_secs = positive(n, to_int(n, v));
        }},
        {"--flagged-rotate-secs", "MALICIOUS_ROTATE_SECS", false, [](Config &c, const std::string &n, const std::string &v) {
            c.flagged_rotate_secs = positive(n, to_int(n, v));
        }},
        {"--normal-ttl-mins", "NORMAL_TTL_MINS", false, [](Config &c, const std::string &n, const std::string &v) {
            c.normal_ttl_mins = non_negative(n, to_int(n, v));
        }},
        {"--flagged-ttl-mins", "MALICIOUS_TTL_MINS", false, [](Config &c, const std::string &n, const std::string &v) {
            c.flagged_ttl_mins = non_negative(n, to_int(n, v));
        }},
        {"--sweep-interval-secs", "SWEEP_INTERVAL_SECS", false, [](Config &c, const std::string &n, const std::string &v) {
            c.sweep_interval_secs = positive(n, to_int(n, v));
        }},
        {"--heartbeat-secs", "HEARTBEAT_SECS", false, [](Config &c, const std::string &n, const std::string &v) {
            c.heartbeat_secs = positive(n, to_int(n, v));
        }},
        {"--reconnect-ms", "RECONNECT_MS", false, [](Config &c, const std::string &n, const std::string &v) {
            c.reconnect_ms = positive(n, to_int(n, v));
        }},
        {"--monitor", "MONITOR", true, [](Config &c, const std::string &n, const std::string &v) { c.monitor = to_bool(n, v); }},
        {"--monitor-verbose", "MONITOR_VERBOSE", true, [](Config &c, const std::string &n, const std::string &v) {
            c.monitor_verbose = to_bool(n, v);
        }},
        {"--no-color", "MONITOR_COLOR", true, [](Config &c, const std::string &n, const std::string &v) {
            c.monitor_color = (n == "--no-color") ? !to_bool(n, v) : to_bool(n, v);
        }},
        {"--respond", "RESPONDER", true, [](Config &c, const std::string &n, const std::string &v) { c.responder = to_bool(n, v); }},
        {"--auto-block", "AUTO_BLOCK", true, [](Config &c, const std::string &n, const std::string &v) { c.auto_block = to_bool(n, v); }},
        {"--dry-run", "DRY_RUN", true, [](Config &c, const std::string &n, const std::string &v) { c.dry_run = to_bool(n, v); }},
        {"--min-confidence", "MIN_CONFIDENCE", false, [](Config &c, const std::string &n, const std::string &v) {
            double d = to_double(n, v);
            if (d < 0.0 || d > 1.0) throw std::invalid_argument(n + ": must be within [0, 1]");
            c.min_confidence = d;
        }},
        {"--actions-log", "ACTIONS_LOG", false, [](Config &c, const std::string &, const std::string &v) { c.actions_log = v; }},
        {"--log-file", "RPCSENTRY_LOG_FILE", false, [](Config &c, const std::string &, const std::string &v) { c.log_file = v; }},
        {"--summarize", "SUMMARY_INPUT", false, [](Config &c, const std::string &, const std::string &v) { c.summarize_input = v; }},
        {"--summary-out", "SUMMARY_OUTPUT", false, [](Config &c, const std::string &, const std::string &v) { c.summary_output = v; }},
        {"--group-field", "SUMMARY_GROUP_FIELD", false, [](Config &c, const std::string &n, const std::string &v) {
            if (v != "sample" && v != "ip") throw std::invalid_argument(n + ": expected sample or ip, got '" + v + "'");
            c.summary_group = v;
        }},
        {"--split-dir", "SUMMARY_SPLIT_DIR", false, [](Config &c, const std::string &, const std::string &v) { c.summary_split_dir = v; }},
    };
    return opts;
}

Config parse_config(const std::vector<std::string> &args, const EnvLookup &env) {
    Config c;
    bool zlat_set = false, zerr_set = false;

    for (const auto &o : options()) {
        auto v = env(o.env);
        if (!v) continue;
        o.apply(c, o.env, *v);
        if (std::string(o.env) == "ZLAT_THR") zlat_set = true;
        if (std::string(o.env) == "ZERR_THR") zerr_set = true;
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string &a = args[i];
        if (a == "--help" || a == "-h") {
            c.help = true;
            continue;
        }
        auto it = std::find_if(options().begin(), options().end(), [&](const Option &o) { return a == o.flag; });
        if (it == options().end()) throw std::invalid_argument("unknown option: " + a);
        if (it->flag_only) {
            it->apply(c, a, "1");
        } else {
            if (i + 1 >= args.size()) throw std::invalid_argument(a + ": missing value");
            it->apply(c, a, args[++i]);
        }
        if (a == "--zlat-thr") zlat_set = true;
        if (a == "--zerr-thr") zerr_set = true;
    }

    if (!zlat_set) c.zlat_thr = c.z_threshold;
    if (!zerr_set) c.zerr_thr = c.z_threshold;
    return c;
}

Config parse_config(int argc, char **argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse_config(args, process_env());
}

std::string usage() {
    std::ostringstream os;
    os << "usage: rpcsentry [options]\n"
       << "  every option falls back to the environment variable shown, then to its default\n";
    for (const auto &o : options()) {
        os << "  " << o.flag << (o.flag_only ? "" : " <value>") << "   (" << o.env << ")\n";
    }
    os << "  --help\n";
    return os.str();
}

std::string describe(const Config &c) {
    std::ostringstream os;
    os << "broker=" << c.broker.host << ":" << c.broker.port
       << " log_path=" << c.log_path
       << " region=" << c.region
       << " asn=" << c.asn
       << " window_ms=" << c.window_ms
       << " zlat_thr=" << c.zlat_thr
       << " zerr_thr=" << c.zerr_thr
       << " p95_thr=" << c.p95_thr
       << " err_thr=" << c.err_thr
       << " tracked=" << (c.track_all_methods ? std::string("*") : std::to_string(c.tracked_methods.size()))
       << " heavy=" << c.heavy_methods.size()
       << " saver=" << (c.saver ? "true" : "false")
       << " monitor=" << (c.monitor ? "true" : "false")
       << " responder=" << (c.responder ? "true" : "false");
    return os.str();
}
