// tests/test_persistence_sink.cpp
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "../src/alert_monitor.hpp"
#include "../src/persistence_sink.hpp"
#include "../src/rotating_writer.hpp"

namespace fs = std::filesystem;

static std::string last_line(const std::string &path) {
    std::ifstream in(path);
    std::string line, last;
    while (std::getline(in, line)) last = line;
    return last;
}

int main() {
    fs::path dir = fs::temp_directory_path() / ("rpcsentry_sink_" + std::to_string(getpid()));
    fs::remove_all(dir);

    RotatingWriter normal((dir / "normal").string(), 1800, normal_file_name);
    RotatingWriter flagged((dir / "flagged").string(), 180, flagged_file_name);
    PersistenceSink sink(normal, flagged, 3.0);

    const double now = 1704164645.0;

    // heartbeat: normal, timestamp from the payload
    auto r = sink.handle("sentinel/health", R"({"ts":1704164000,"status":"ok"})", now);
    if (r != PersistenceSink::Route::Normal || !normal.current_path() ||
        fs::path(*normal.current_path()).filename() != "log-20240102-0230.jsonl") {
        std::cerr << "heartbeat should go to the normal bucket of its own ts\n";
        return 2;
    }

    // alert with a high z: flagged
    r = sink.handle("sentinel/diag", R"({"ts":1704164645,"method":"getLogs","z":{"lat":4.2,"err":0.1}})", now);
    if (r != PersistenceSink::Route::Flagged || !flagged.current_path()) {
        std::cerr << "z.lat above threshold should be flagged\n";
        return 3;
    }
    // alert below the z threshold: normal
    r = sink.handle("sentinel/diag", R"({"ts":1704164645,"z":{"lat":1.0,"err":2.99}})", now);
    if (r != PersistenceSink::Route::Normal) {
        std::cerr << "low z should be normal\n";
        return 4;
    }
    // sentinel/alert* topics are always flagged
    r = sink.handle("sentinel/alerts/manual", R"({"note":"x"})", now);
    if (r != PersistenceSink::Route::Flagged) {
        std::cerr << "sentinel/alert prefix should be flagged\n";
        return 5;
    }

    // non-JSON is wrapped and stamped with now
    r = sink.handle("sentinel/raw", "plain text", now);
    nlohmann::json wrapped = nlohmann::json::parse(last_line(*normal.current_path()));
    if (r != PersistenceSink::Route::Normal || wrapped != nlohmann::json{{"raw", "plain text"}}) {
        std::cerr << "unparseable payload not wrapped: " << wrapped.dump() << "\n";
        return 6;
    }
    if (sink.normal_count() != 3 || sink.flagged_count() != 2 || sink.failed_count() != 0) {
        std::cerr << "route counters wrong\n";
        return 7;
    }
    if (payload_timestamp(nlohmann::json{{"ts", "soon"}}, 5.0) != 5.0) {
        std::cerr << "non-numeric ts must fall back to now\n";
        return 8;
    }
    if (payload_timestamp(nlohmann::json{{"ts", 1e300}}, 5.0) != 5.0 ||
        payload_timestamp(nlohmann::json{{"ts", -1e300}}, 5.0) != 5.0) {
        std::cerr << "out-of-range ts must fall back to now\n";
        return 14;
    }

    // console rendering of the same traffic
    AnomalyClassifier classifier(TriggerThresholds{}, {});
    std::ostringstream out;
    AlertMonitor quiet(classifier, MonitorOptions{false, false}, out);
    if (quiet.handle("sentinel/health", R"({"ts":1,"status":"ok"})", now) || !out.str().empty()) {
        std::cerr << "health shown without verbose\n";
        return 9;
    }
    if (!quiet.handle("sentinel/diag", R"({"ts":7,"metrics":{"p95":10,"err_rate":0.2},"z":{"lat":0,"err":0}})", now)) {
        std::cerr << "error-rate alert not shown\n";
        return 10;
    }
    nlohmann::json shown = nlohmann::json::parse(out.str());
    if (shown["ts"] != 7 || shown["topic"] != "sentinel/diag" || shown["data"]["metrics"]["err_rate"] != 0.2) {
        std::cerr << "rendered line wrong: " << out.str() << "\n";
        return 11;
    }

    AlertMonitor colored(classifier, MonitorOptions{true, true}, out);
    nlohmann::json hb = {{"ts", 1}};
    std::string health = colored.render("sentinel/health", hb, false, now);
    std::string alert = colored.render("sentinel/diag", hb, true, now);
    std::string other = colored.render("sentinel/x", hb, false, now);
    if (health.rfind("\033[2m\033[1;32m", 0) != 0 || alert.rfind("\033[1;31m", 0) != 0 ||
        other.rfind("\033[36m", 0) != 0 || alert.substr(alert.size() - 4) != "\033[0m") {
        std::cerr << "colour codes wrong\n";
        return 12;
    }
    if (!colored.is_malicious("sentinel/alert", nlohmann::json::object()) ||
        colored.is_malicious("sentinel/diag", nlohmann::json{{"z", {{"lat", 1.0}}}})) {
        std::cerr << "malicious detection wrong\n";
        return 13;
    }

    normal.close();
    flagged.close();
    fs::remove_all(dir);
    std::cout << "test_persistence_sink: OK\n";
    return 0;
}
