// src/main.cpp
// rpcsentry entry point: parse the configuration, wire the agent onto one
// event loop and run until SIGINT/SIGTERM.

#include "agent.hpp"
#include "attack_summary.hpp"
#include "classifier.hpp"
#include "config.hpp"
#include "event_loop.hpp"
#include "transport.hpp"
#include "util_log.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <new>
#include <stdexcept>

// Set once the loop exists; the handler only flips its atomic stop flag.
static EventLoop *g_loop = nullptr;

static void handle_signal(int) {
    if (g_loop) g_loop->stop();
}

int main(int argc, char** argv) {
    Config cfg;
    try {
        cfg = parse_config(argc, argv);
    } catch (const std::invalid_argument &e) {
        safe_log(std::string("Configuration error: ") + e.what());
        std::cerr << usage();
        return 2;
    }
    if (cfg.help) {
        std::cout << usage();
        return 0;
    }
    set_log_file(cfg.log_file);

    if (!cfg.summarize_input.empty()) {
        AnomalyClassifier classifier(TriggerThresholds{cfg.zlat_thr, cfg.zerr_thr, cfg.p95_thr, cfg.err_thr},
                                     cfg.heavy_methods);
        AttackSummarizer summarizer(classifier, SummaryOptions{cfg.summary_group, cfg.summary_split_dir});
        try {
            summarizer.add_file(cfg.summarize_input);
        } catch (const std::runtime_error &e) {
            safe_log(std::string("Summary failed: ") + e.what());
            return 1;
        }
        if (!write_summary(summarizer, cfg.summary_output)) return 1;
        safe_log("Summary: " + std::to_string(summarizer.summary().size()) + " sources from "
                 + std::to_string(summarizer.accepted()) + " records ("
                 + std::to_string(summarizer.skipped()) + " skipped) -> " + cfg.summary_output);
        return 0;
    }
    safe_log("Starting rpcsentry; " + describe(cfg));

    EventLoop loop;
    std::unique_ptr<Agent> agent;
    try {
        safe_log("STEP: constructing Agent");
        agent = std::make_unique<Agent>(cfg, loop, std::make_unique<TcpTransport>(), std::cout);
        agent->start();
        safe_log("OK: Agent started");
    } catch (const std::bad_alloc &ba) {
        safe_log(std::string("Agent construction bad_alloc: ") + ba.what());
        return 1;
    } catch (const std::exception &e) {
        safe_log(std::string("Agent construction exception: ") + e.what());
        return 1;
    }

    g_loop = &loop;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        loop.run();
    } catch (const std::exception &e) {
        safe_log(std::string("Event loop exception: ") + e.what());
        agent->shutdown();
        return 1;
    }

    safe_log("Shutdown: signal received");
    agent->shutdown();
    g_loop = nullptr;
    safe_log("rpcsentry shutting down normally.");
    return 0;
}
