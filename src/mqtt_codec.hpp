#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Minimal MQTT 3.1.1 framing: enough for a QoS 0 publisher/subscriber.

enum class MqttPacketType : uint8_t {
    Connect = 1,
    Connack = 2,
    Publish = 3,
    Puback = 4,
    Subscribe = 8,
    Suback = 9,
    Pingreq = 12,
    Pingresp = 13,
    Disconnect = 14,
};

struct MqttPacket {
    MqttPacketType type;
    uint8_t flags = 0;  // low nibble of the fixed header
    std::string body;   // variable header + payload
};

struct MqttPublish {
    std::string topic;
    std::string payload;
    uint8_t qos = 0;
    uint16_t packet_id = 0;
};

class MqttProtocolError : public std::runtime_error {
public:
    explicit MqttProtocolError(const std::string &what) : std::runtime_error(what) {}
};

constexpr size_t kMqttMaxPacket = 16u * 1024u * 1024u;

std::string mqtt_encode_remaining_length(size_t n);

std::string mqtt_connect(const std::string &client_id, uint16_t keepalive_seconds);
std::string mqtt_publish(const std::string &topic, const std::string &payload);
std::string mqtt_subscribe(uint16_t packet_id, const std::vector<std::string> &patterns);
std::string mqtt_puback(uint16_t packet_id);
std::string mqtt_pingreq();
std::string mqtt_disconnect();

// CONNACK return code (0 = accepted); nullopt if the packet is not a CONNACK.
std::optional<uint8_t> mqtt_connack_code(const MqttPacket &p);

// Throws MqttProtocolError on a truncated PUBLISH.
MqttPublish mqtt_parse_publish(const MqttPacket &p);

// Accumulates stream bytes and cuts them into packets.
class MqttFrameDecoder {
public:
    void feed(const char *data, size_t n) { buf_.append(data, n); }

    // Next complete packet, nullopt if more bytes are needed.
    // Throws MqttProtocolError on a malformed or oversized fixed header.
    std::optional<MqttPacket> next();

    size_t buffered() const noexcept { return buf_.size(); }
    void clear() noexcept { buf_.clear(); }

private:
    std::string buf_;
};
