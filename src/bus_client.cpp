#include "bus_client.hpp"
#include "topic.hpp"
#include "util_log.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

const char *bus_state_name(BusState s) {
    switch (s) {
        case BusState::Disconnected: return "disconnected";
        case BusState::Connecting: return "connecting";
        case BusState::Connected: return "connected";
        case BusState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

BusClient::BusClient(EventLoop &loop, std::unique_ptr<Transport> transport, BusOptions opts)
    : loop_(loop), transport_(std::move(transport)), opts_(std::move(opts)) {}

BusClient::~BusClient() {
    shutdown();
}

void BusClient::start() {
    shut_down_ = false;
    if (state_ == BusState::Disconnected) schedule_reconnect(EventLoop::Millis(0));
}

void BusClient::schedule_reconnect(EventLoop::Millis delay) {
    if (shut_down_ || loop_.is_active(reconnect_id_)) return;
    reconnect_id_ = loop_.schedule("bus-reconnect", [this]() -> std::optional<EventLoop::Millis> {
        reconnect_id_ = 0;
        connect(opts_.host, opts_.port);
        return std::nullopt;
    }, delay);
}

void BusClient::send_raw(const std::string &bytes) {
    transport_->send_all(bytes);
}

MqttPacket BusClient::await_packet() {
    char buf[4096];
    while (true) {
        auto p = decoder_.next();
        if (p) return *p;
        size_t n = transport_->receive(buf, sizeof(buf));
        if (n == 0) throw TransportError("connection closed by broker");
        decoder_.feed(buf, n);
    }
}

bool BusClient::connect(const std::string &host, uint16_t port) {
    if (shut_down_) return false;
    if (state_ == BusState::Connected) return true;

    opts_.host = host;
    opts_.port = port;
    state_ = BusState::Connecting;
    safe_log("BusClient: connecting to " + host + ":" + std::to_string(port));

    try {
        transport_->open(host, port);
        decoder_.clear();
        send_raw(mqtt_connect(opts_.client_id, opts_.keepalive_seconds));

        MqttPacket p = await_packet();
        auto code = mqtt_connack_code(p);
        if (!code) throw MqttProtocolError("expected CONNACK");
        if (*code != 0) throw TransportError("broker refused connection, code " + std::to_string(*code));
    } catch (const std::runtime_error &e) {
        // TransportError or MqttProtocolError
        connection_lost(e.what());
        return false;
    }

    state_ = BusState::Connected;
    connects_ += 1;
    safe_log("BusClient: connected (" + std::to_string(connects_) + " total)");

    if (transport_->fd() >= 0) {
        watch_id_ = loop_.watch_readable(transport_->fd(), [this] { pump(); });
    }

    if (!subs_.empty()) {
        std::vector<std::string> patterns;
        for (const auto &s : subs_) {
            if (std::find(patterns.begin(), patterns.end(), s.pattern) == patterns.end()) {
                patterns.push_back(s.pattern);
            }
        }
        try {
            send_raw(mqtt_subscribe(next_packet_id_++, patterns));
        } catch (const std::runtime_error &e) {
            connection_lost(e.what());
            return false;
        }
        if (next_packet_id_ == 0) next_packet_id_ = 1;
    }

    start_session();
    // a packet may have arrived together with the CONNACK
    if (decoder_.buffered() > 0) drain();
    return state_ == BusState::Connected;
}

void BusClient::start_session() {
    for (const auto &task : session_tasks_) {
        session_ids_.push_back(loop_.every(task.name, task.interval, task.fn, true));
    }
    if (opts_.keepalive_seconds > 0) {
        EventLoop::Millis ping_every(static_cast<int64_t>(opts_.keepalive_seconds) * 500);
        session_ids_.push_back(loop_.every("bus-ping", ping_every, [this] {
            if (!connected()) return;
            try {
                send_raw(mqtt_pingreq());
            } catch (const TransportError &e) {
                connection_lost(e.what());
            }
        }));
    }
}

void BusClient::stop_session() {
    for (auto id : session_ids_) loop_.cancel(id);
    session_ids_.clear();
}

size_t BusClient::active_session_tasks() const {
    return static_cast<size_t>(std::count_if(session_ids_.begin(), session_ids_.end(),
                                             [this](EventLoop::TaskId id) { return loop_.is_active(id); }));
}

void BusClient::connection_lost(const std::string &why) {
    // cancel dependents before the handle goes away
    stop_session();
    if (watch_id_ != 0) {
        loop_.unwatch(watch_id_);
        watch_id_ = 0;
    }
    transport_->close();
    decoder_.clear();

    if (shut_down_) {
        state_ = BusState::Disconnected;
        return;
    }
    state_ = BusState::Reconnecting;
    safe_log("BusClient: " + why + ". reconnect in " + std::to_string(opts_.reconnect_backoff.count()) + "ms");
    schedule_reconnect(opts_.reconnect_backoff);
}

void BusClient::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;
    if (reconnect_id_ != 0) {
        loop_.cancel(reconnect_id_);
        reconnect_id_ = 0;
    }
    if (state_ == BusState::Connected) {
        try {
            send_raw(mqtt_disconnect());
        } catch (const TransportError &e) {
            safe_log(std::string("BusClient: disconnect failed: ") + e.what());
        }
    }
    stop_session();
    if (watch_id_ != 0) {
        loop_.unwatch(watch_id_);
        watch_id_ = 0;
    }
    transport_->close();
    state_ = BusState::Disconnected;
}

bool BusClient::publish(const std::string &topic, const std::string &payload) {
    if (state_ != BusState::Connected) {
        dropped_ += 1;
        return false;
    }
    try {
        send_raw(mqtt_publish(topic, payload));
    } catch (const std::runtime_error &e) {
        dropped_ += 1;
        connection_lost(std::string("publish failed: ") + e.what());
        return false;
    }
    published_ += 1;
    return true;
}

void BusClient::subscribe(const std::string &pattern, Handler handler) {
    if (!valid_topic_pattern(pattern)) {
        throw std::invalid_argument("invalid topic pattern: " + pattern);
    }
    subs_.push_back(Subscription{pattern, std::move(handler)});
    if (state_ != BusState::Connected) return;
    try {
        send_raw(mqtt_subscribe(next_packet_id_++, {pattern}));
        if (next_packet_id_ == 0) next_packet_id_ = 1;
    } catch (const std::runtime_error &e) {
        connection_lost(std::string("subscribe failed: ") + e.what());
    }
}

void BusClient::add_session_task(std::string name, EventLoop::Millis interval, std::function<void()> fn) {
    session_tasks_.push_back(SessionTask{name, interval, fn});
    if (state_ == BusState::Connected) {
        session_ids_.push_back(loop_.every(std::move(name), interval, std::move(fn), true));
    }
}

void BusClient::pump() {
    if (state_ != BusState::Connected) return;
    char buf[8192];
    size_t n = 0;
    try {
        n = transport_->receive(buf, sizeof(buf));
    } catch (const TransportError &e) {
        connection_lost(e.what());
        return;
    }
    if (n == 0) {
        connection_lost("connection closed by broker");
        return;
    }
    decoder_.feed(buf, n);
    drain();
}

void BusClient::drain() {
    try {
        while (state_ == BusState::Connected) {
            auto p = decoder_.next();
            if (!p) break;
            handle_packet(*p);
        }
    } catch (const std::runtime_error &e) {
        connection_lost(e.what());
    }
}

void BusClient::handle_packet(const MqttPacket &p) {
    switch (p.type) {
        case MqttPacketType::Publish: {
            MqttPublish pub = mqtt_parse_publish(p);
            if (pub.qos == 1) send_raw(mqtt_puback(pub.packet_id));
            for (size_t i = 0; i < subs_.size(); ++i) {
                if (!topic_matches(subs_[i].pattern, pub.topic)) continue;
                delivered_ += 1;
                // copy: a handler may subscribe and grow subs_
                Handler h = subs_[i].handler;
                try {
                    h(pub.topic, pub.payload);
                } catch (const std::exception &e) {
                    safe_log("BusClient: handler for " + pub.topic + " failed: " + e.what());
                }
            }
            break;
        }
        case MqttPacketType::Suback:
            for (size_t i = 2; i < p.body.size(); ++i) {
                if (static_cast<uint8_t>(p.body[i]) == 0x80) safe_log("BusClient: broker rejected a subscription");
            }
            break;
        case MqttPacketType::Pingresp:
            break;
        default:
            safe_log("BusClient: ignoring packet type " + std::to_string(static_cast<int>(p.type)));
            break;
    }
}
