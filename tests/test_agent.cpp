// tests/test_agent.cpp
// End to end on a fake broker: lines in, alert and heartbeat out, echo saved.
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "../src/agent.hpp"
#include "../src/mqtt_codec.hpp"
#include "fake_transport.hpp"

namespace fs = std::filesystem;

static std::vector<MqttPublish> published(const FakeWire &wire) {
    std::vector<MqttPublish> out;
    for (const auto &bytes : wire.sent) {
        MqttFrameDecoder d;
        d.feed(bytes.data(), bytes.size());
        auto p = d.next();
        if (p && p->type == MqttPacketType::Publish) out.push_back(mqtt_parse_publish(*p));
    }
    return out;
}

int main() {
    fs::path dir = fs::temp_directory_path() / ("rpcsentry_agent_" + std::to_string(getpid()));
    fs::remove_all(dir);

    Config cfg;
    cfg.log_path = (dir / "rpc.jsonl").string();
    cfg.normal_dir = (dir / "normal").string();
    cfg.flagged_dir = (dir / "flagged").string();
    cfg.actions_log = (dir / "actions.log").string();
    cfg.monitor = true;
    cfg.responder = true;
    cfg.auto_block = true;

    EventLoop loop;
    auto wire = std::make_shared<FakeWire>();
    std::ostringstream console;
    Agent agent(cfg, loop, std::make_unique<FakeTransport>(wire), console);
    agent.start();
    for (int i = 0; i < 50 && !agent.bus().connected(); ++i) loop.run_once(EventLoop::Millis(5));
    if (!agent.bus().connected()) {
        std::cerr << "agent did not connect\n";
        return 2;
    }
    loop.run_once(EventLoop::Millis(0));

    bool heartbeat = false;
    for (const auto &p : published(*wire)) {
        if (p.topic == "sentinel/health" && nlohmann::json::parse(p.payload)["status"] == "ok") heartbeat = true;
    }
    if (!heartbeat) {
        std::cerr << "no heartbeat after connect\n";
        return 3;
    }

    // untracked methods and garbage are dropped; a classifier-heavy method
    // is still not tracked by default
    double t = wall_clock_seconds();
    agent.process_line(R"({"method":"getSlot","lat_ms":999})", t);
    agent.process_line(R"({"method":"getSignaturesForAddress","lat_ms":999})", t);
    agent.process_line("garbage", t);
    if (agent.parse_errors() != 1 || agent.aggregator().get_ignored() != 2) {
        std::cerr << "filtering wrong\n";
        return 4;
    }

    // a quiet window first, so the next one starts at a known time
    if (agent.process_line(R"({"method":"getLogs","lat_ms":1})", t + 10.0) != 0 || agent.aggregator().get_flushes() != 1) {
        std::cerr << "quiet window should flush without an alert\n";
        return 40;
    }

    // a slow heavy method, flushed by the first event past the window
    for (int i = 0; i < 20; ++i) {
        agent.process_line(R"({"ip":"198.51.100.4","method":"getProgramAccounts","lat_ms":900,"status":200})", t + 10.01);
    }
    size_t sent = agent.process_line(R"({"ip":"198.51.100.4","method":"getProgramAccounts","lat_ms":900})", t + 11.0);
    if (sent != 1 || agent.alerts_published() != 1) {
        std::cerr << "expected one alert, got " << sent << "\n";
        return 5;
    }
    MqttPublish alert;
    for (const auto &p : published(*wire)) {
        if (p.topic == "sentinel/diag") alert = p;
    }
    nlohmann::json a = nlohmann::json::parse(alert.payload);
    if (a["method"] != "getProgramAccounts" || a["metrics"]["calls"] != 21 || a["metrics"]["p95"] != 900.0 ||
        a["sample"].get<std::string>().rfind("iphash:", 0) != 0 || a["window_ms"] != 250) {
        std::cerr << "alert payload wrong: " << alert.payload << "\n";
        return 6;
    }

    // the broker echoes the alert back to our own subscriptions
    wire->incoming.push_back(mqtt_publish(alert.topic, alert.payload));
    agent.bus().pump();
    if (!agent.sink() || agent.sink()->normal_count() + agent.sink()->flagged_count() != 1) {
        std::cerr << "echoed alert not persisted\n";
        return 7;
    }
    if (console.str().find("\"topic\":\"sentinel/diag\"") == std::string::npos) {
        std::cerr << "monitor did not print the alert\n";
        return 8;
    }
    // resource exhaustion on a heavy method: high severity, 0.85 confidence, rate limit only
    if (!agent.responder() || agent.responder()->handled() != 1 || !agent.firewall().list().empty()) {
        std::cerr << "responder outcome wrong\n";
        return 9;
    }

    agent.shutdown();
    if (agent.bus().state() != BusState::Disconnected || loop.task_count() != 0) {
        std::cerr << "shutdown left work behind\n";
        return 10;
    }

    fs::remove_all(dir);
    std::cout << "test_agent: OK\n";
    return 0;
}
