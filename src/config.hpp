#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

struct BrokerAddress {
    std::string host = "localhost";
    uint16_t port = 1883;
};

// mqtt://host[:port] or tcp://host[:port]; a bare host[:port] is accepted too.
// Throws std::invalid_argument.
BrokerAddress parse_broker_url(const std::string &url);

struct Config {
    std::string broker_url = "mqtt://localhost:1883";
    BrokerAddress broker;
    std::string log_path = "/data/rpc.jsonl";
    std::string region = "eu-central";
    int64_t asn = 64512;
    uint64_t window_ms = 250;

    double z_threshold = 3.0;
    double zlat_thr = 3.0;
    double zerr_thr = 3.0;
    double p95_thr = 250.0;
    double err_thr = 0.05;

    std::string salt = "change-me";
    // aggregated by the window; the classifier's heavy set is separate
    std::unordered_set<std::string> tracked_methods{"getProgramAccounts", "getLogs"};
    bool track_all_methods = false;
    std::unordered_set<std::string> heavy_methods{"getProgramAccounts", "getLogs", "getSignaturesForAddress"};

    bool saver = true;
    std::string normal_dir = "/data/logs_normal";
    std::string flagged_dir = "/data/malicious_logs";
    int64_t normal_rotate_secs = 1800;
    int64_t flagged_rotate_secs = 180;
    int64_t normal_ttl_mins = 120;
    int64_t flagged_ttl_mins = 0;
    int64_t sweep_interval_secs = 60;

    int64_t heartbeat_secs = 5;
    int64_t reconnect_ms = 1000;

    bool monitor = false;
    bool monitor_verbose = false;
    bool monitor_color = true;

    bool responder = false;
    bool auto_block = false;
    bool dry_run = false;
    double min_confidence = 0.75;
    std::string actions_log = "/data/actions.log";

    std::string log_file = "rpcsentry.err.log";

    // offline mode: summarize a flagged log and exit instead of running the agent
    std::string summarize_input;
    std::string summary_output = "data/ip_summary.json";
    std::string summary_group = "sample";  // "sample" or "ip"
    std::string summary_split_dir;
    bool help = false;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string &name)>;

// getenv-backed lookup; empty values count as unset.
EnvLookup process_env();

// Flag, then environment variable, then default. Bad values throw
// std::invalid_argument naming the option.
Config parse_config(const std::vector<std::string> &args, const EnvLookup &env);
Config parse_config(int argc, char **argv);

std::string usage();
std::string describe(const Config &c);
