#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "alert_monitor.hpp"
#include "bus_client.hpp"
#include "classifier.hpp"
#include "config.hpp"
#include "event_loop.hpp"
#include "firewall.hpp"
#include "log_tailer.hpp"
#include "persistence_sink.hpp"
#include "response_handler.hpp"
#include "retention_sweeper.hpp"
#include "rotating_writer.hpp"
#include "window_aggregator.hpp"

double wall_clock_seconds();

// Everything one rpcsentry process runs, wired onto a single EventLoop:
// tail -> parse -> window -> trigger -> publish, the heartbeat, and the
// optional bus consumers (saver, monitor, responder).
class Agent {
public:
    static constexpr size_t kMaxLinesPerStep = 512;

    Agent(Config cfg, EventLoop &loop, std::unique_ptr<Transport> transport, std::ostream &console);

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // Registers every task and subscription, queues the first connect.
    void start();
    void shutdown();

    // Parse one raw line received at `now`; returns alerts published.
    size_t process_line(const std::string &line, double now);

    // Drain what the tailer has; the delay is when to look again.
    std::optional<EventLoop::Millis> tail_step();

    // Run both retention sweepers; returns files removed.
    size_t sweep(double now);

    BusClient &bus() noexcept { return bus_; }
    const WindowAggregator &aggregator() const noexcept { return agg_; }
    const AnomalyClassifier &classifier() const noexcept { return classifier_; }
    PersistenceSink *sink() noexcept { return sink_.get(); }
    ResponseHandler *responder() noexcept { return responder_.get(); }
    const RecordingFirewall &firewall() const noexcept { return firewall_; }
    uint64_t parse_errors() const noexcept { return parse_errors_; }
    uint64_t alerts_published() const noexcept { return alerts_; }

private:
    Config cfg_;
    EventLoop &loop_;
    BusClient bus_;
    LogTailer tailer_;
    WindowAggregator agg_;
    AnomalyClassifier classifier_;
    RecordingFirewall firewall_;
    std::ostream &console_;

    std::unique_ptr<RotatingWriter> normal_writer_;
    std::unique_ptr<RotatingWriter> flagged_writer_;
    std::unique_ptr<PersistenceSink> sink_;
    std::unique_ptr<RetentionSweeper> normal_sweeper_;
    std::unique_ptr<RetentionSweeper> flagged_sweeper_;
    std::unique_ptr<AlertMonitor> monitor_;
    std::unique_ptr<ResponseHandler> responder_;

    EventLoop::TaskId tail_task_ = 0;
    EventLoop::TaskId sweep_task_ = 0;
    uint64_t parse_errors_ = 0;
    uint64_t alerts_ = 0;
};
