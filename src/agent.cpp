#include "agent.hpp"
#include "alert.hpp"
#include "parser.hpp"
#include "util_log.hpp"

#include <chrono>
#include <cmath>

double wall_clock_seconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

static BusOptions bus_options(const Config &cfg) {
    BusOptions o;
    o.host = cfg.broker.host;
    o.port = cfg.broker.port;
    o.client_id = "rpcsentry-" + cfg.region;
    o.reconnect_backoff = EventLoop::Millis(cfg.reconnect_ms);
    return o;
}

static TriggerThresholds thresholds(const Config &cfg) {
    TriggerThresholds t;
    t.z_latency = cfg.zlat_thr;
    t.z_error = cfg.zerr_thr;
    t.p95_ms = cfg.p95_thr;
    t.error_rate = cfg.err_thr;
    return t;
}

Agent::Agent(Config cfg, EventLoop &loop, std::unique_ptr<Transport> transport, std::ostream &console)
    : cfg_(std::move(cfg)),
      loop_(loop),
      bus_(loop, std::move(transport), bus_options(cfg_)),
      tailer_(cfg_.log_path),
      agg_(cfg_.window_ms, wall_clock_seconds(), cfg_.tracked_methods, cfg_.track_all_methods),
      classifier_(thresholds(cfg_), cfg_.heavy_methods),
      console_(console) {
    if (cfg_.saver) {
        normal_writer_ = std::make_unique<RotatingWriter>(cfg_.normal_dir, cfg_.normal_rotate_secs, normal_file_name);
        flagged_writer_ = std::make_unique<RotatingWriter>(cfg_.flagged_dir, cfg_.flagged_rotate_secs, flagged_file_name);
        sink_ = std::make_unique<PersistenceSink>(*normal_writer_, *flagged_writer_, cfg_.z_threshold);
        normal_sweeper_ = std::make_unique<RetentionSweeper>(
            RetentionPolicy{cfg_.normal_dir, cfg_.normal_ttl_mins * 60, cfg_.sweep_interval_secs}, normal_writer_.get());
        flagged_sweeper_ = std::make_unique<RetentionSweeper>(
            RetentionPolicy{cfg_.flagged_dir, cfg_.flagged_ttl_mins * 60, cfg_.sweep_interval_secs}, flagged_writer_.get());
    }
    if (cfg_.monitor) {
        monitor_ = std::make_unique<AlertMonitor>(classifier_, MonitorOptions{cfg_.monitor_color, cfg_.monitor_verbose}, console_);
    }
    if (cfg_.responder || cfg_.auto_block) {
        ResponseOptions ro;
        ro.auto_block = cfg_.auto_block;
        ro.dry_run = cfg_.dry_run;
        ro.min_confidence = cfg_.min_confidence;
        ro.actions_log = cfg_.actions_log;
        responder_ = std::make_unique<ResponseHandler>(classifier_, firewall_, ro);
    }
}

size_t Agent::process_line(const std::string &line, double now) {
    auto ev = parse_event_line(line, cfg_.salt, now);
    if (!ev) {
        parse_errors_ += 1;
        return 0;
    }

    auto flushed = agg_.add(*ev, now);
    size_t published = 0;
    for (const auto &w : flushed) {
        if (!classifier_.should_trigger(w.snapshot)) continue;
        Alert a = make_alert(w, static_cast<int64_t>(std::floor(now)), cfg_.window_ms, cfg_.region, cfg_.asn,
                             ev->source_id);
        alerts_ += 1;
        if (bus_.publish(kTopicAlert, encode_alert(a))) published += 1;
    }
    return published;
}

std::optional<EventLoop::Millis> Agent::tail_step() {
    for (size_t i = 0; i < kMaxLinesPerStep; ++i) {
        auto p = tailer_.poll();
        if (!p.line) return p.retry_after;
        process_line(*p.line, wall_clock_seconds());
    }
    // more may be waiting; let the other tasks run first
    return EventLoop::Millis(0);
}

size_t Agent::sweep(double now) {
    size_t n = 0;
    if (normal_sweeper_) n += normal_sweeper_->sweep(now);
    if (flagged_sweeper_) n += flagged_sweeper_->sweep(now);
    return n;
}

void Agent::start() {
    safe_log("Agent: " + describe(cfg_));

    bus_.add_session_task("heartbeat", EventLoop::Millis(cfg_.heartbeat_secs * 1000), [this] {
        Heartbeat hb;
        hb.ts = static_cast<int64_t>(std::floor(wall_clock_seconds()));
        hb.region = cfg_.region;
        hb.asn = cfg_.asn;
        bus_.publish(kTopicHealth, encode_heartbeat(hb));
    });

    if (sink_) {
        bus_.subscribe(kTopicAll, [this](const std::string &topic, const std::string &payload) {
            sink_->handle(topic, payload, wall_clock_seconds());
        });
        sweep_task_ = loop_.every("retention", EventLoop::Millis(cfg_.sweep_interval_secs * 1000),
                                  [this] { sweep(wall_clock_seconds()); }, true);
    }
    if (monitor_) {
        bus_.subscribe(kTopicAll, [this](const std::string &topic, const std::string &payload) {
            monitor_->handle(topic, payload, wall_clock_seconds());
        });
    }
    if (responder_) {
        bus_.subscribe(kTopicAlert, [this](const std::string &, const std::string &payload) {
            responder_->handle(payload, wall_clock_seconds());
        });
    }

    tail_task_ = loop_.schedule("tail", [this] { return tail_step(); });
    bus_.start();
}

void Agent::shutdown() {
    if (tail_task_ != 0) loop_.cancel(tail_task_);
    if (sweep_task_ != 0) loop_.cancel(sweep_task_);
    tail_task_ = sweep_task_ = 0;
    bus_.shutdown();
    if (normal_writer_) normal_writer_->close();
    if (flagged_writer_) flagged_writer_->close();
    safe_log("Agent: stopped. events=" + std::to_string(agg_.get_total()) +
             " parse_errors=" + std::to_string(parse_errors_) +
             " alerts=" + std::to_string(alerts_) +
             " published=" + std::to_string(bus_.published()) +
             " dropped=" + std::to_string(bus_.dropped()));
}
