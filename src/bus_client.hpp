#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "event_loop.hpp"
#include "mqtt_codec.hpp"
#include "transport.hpp"

// Disconnected -> Connecting -> Connected -> (error) Reconnecting -> Connecting ...
enum class BusState { Disconnected, Connecting, Connected, Reconnecting };

const char *bus_state_name(BusState s);

struct BusOptions {
    std::string host = "localhost";
    uint16_t port = 1883;
    std::string client_id = "rpcsentry";
    EventLoop::Millis reconnect_backoff{1000};
    uint16_t keepalive_seconds = 60;
};

// At-most-once publish/subscribe client over MQTT 3.1.1 (QoS 0).
//
// Every failure goes through connection_lost(): the session tasks that were
// using the connection are cancelled, the transport is closed, and a single
// reconnect attempt is scheduled after the fixed backoff. Retries never stop.
// Subscriptions survive reconnects and are re-sent on every connect, session
// tasks are restarted on every connect.
class BusClient {
public:
    using Handler = std::function<void(const std::string &topic, const std::string &payload)>;

    BusClient(EventLoop &loop, std::unique_ptr<Transport> transport, BusOptions opts);
    ~BusClient();

    BusClient(const BusClient&) = delete;
    BusClient& operator=(const BusClient&) = delete;

    // Queue the first connect on the loop; failures fall into the reconnect loop.
    void start();

    // One blocking attempt; true when Connected.
    bool connect(const std::string &host, uint16_t port);

    // DISCONNECT and close; no further reconnects.
    void shutdown();

    // Dropped (false) when not connected or when the send fails.
    bool publish(const std::string &topic, const std::string &payload);

    void subscribe(const std::string &pattern, Handler handler);

    void add_session_task(std::string name, EventLoop::Millis interval, std::function<void()> fn);

    // Read what the transport has and dispatch complete packets.
    // Called by the loop on socket readiness.
    void pump();

    BusState state() const noexcept { return state_; }
    bool connected() const noexcept { return state_ == BusState::Connected; }
    size_t active_session_tasks() const;
    uint64_t connects() const noexcept { return connects_; }
    uint64_t published() const noexcept { return published_; }
    uint64_t dropped() const noexcept { return dropped_; }
    uint64_t delivered() const noexcept { return delivered_; }

private:
    struct Subscription {
        std::string pattern;
        Handler handler;
    };
    struct SessionTask {
        std::string name;
        EventLoop::Millis interval;
        std::function<void()> fn;
    };

    void connection_lost(const std::string &why);
    void schedule_reconnect(EventLoop::Millis delay);
    void start_session();
    void stop_session();
    void send_raw(const std::string &bytes);
    MqttPacket await_packet();
    void drain();
    void handle_packet(const MqttPacket &p);

    EventLoop &loop_;
    std::unique_ptr<Transport> transport_;
    BusOptions opts_;
    BusState state_ = BusState::Disconnected;
    bool shut_down_ = false;

    MqttFrameDecoder decoder_;
    std::vector<Subscription> subs_;
    std::vector<SessionTask> session_tasks_;
    std::vector<EventLoop::TaskId> session_ids_;
    EventLoop::TaskId reconnect_id_ = 0;
    EventLoop::WatchId watch_id_ = 0;
    uint16_t next_packet_id_ = 1;

    uint64_t connects_ = 0;
    uint64_t published_ = 0;
    uint64_t dropped_ = 0;
    uint64_t delivered_ = 0;
};
