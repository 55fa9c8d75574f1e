#include "mqtt_codec.hpp"

static void put_u16(std::string &out, uint16_t v) {
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>(v & 0xFF));
}

static void put_str(std::string &out, const std::string &s) {
    if (s.size() > 0xFFFF) throw MqttProtocolError("string field longer than 65535 bytes");
    put_u16(out, static_cast<uint16_t>(s.size()));
    out += s;
}

static uint16_t get_u16(const std::string &b, size_t pos) {
    return static_cast<uint16_t>((static_cast<uint8_t>(b[pos]) << 8) | static_cast<uint8_t>(b[pos + 1]));
}

static std::string frame(MqttPacketType type, uint8_t flags, const std::string &body) {
    std::string out;
    out.push_back(static_cast<char>((static_cast<uint8_t>(type) << 4) | (flags & 0x0F)));
    out += mqtt_encode_remaining_length(body.size());
    out += body;
    return out;
}

std::string mqtt_encode_remaining_length(size_t n) {
    if (n > 268435455u) throw MqttProtocolError("remaining length too large");
    std::string out;
    do {
        uint8_t byte = static_cast<uint8_t>(n % 128);
        n /= 128;
        if (n > 0) byte |= 0x80;
        out.push_back(static_cast<char>(byte));
    } while (n > 0);
    return out;
}

std::string mqtt_connect(const std::string &client_id, uint16_t keepalive_seconds) {
    std::string body;
    put_str(body, "MQTT");
    body.push_back(static_cast<char>(4));     // protocol level 3.1.1
    body.push_back(static_cast<char>(0x02));  // clean session
    put_u16(body, keepalive_seconds);
    put_str(body, client_id);
    return frame(MqttPacketType::Connect, 0, body);
}

std::string mqtt_publish(const std::string &topic, const std::string &payload) {
    std::string body;
    put_str(body, topic);
    body += payload;
    return frame(MqttPacketType::Publish, 0, body);
}

std::string mqtt_subscribe(uint16_t packet_id, const std::vector<std::string> &patterns) {
    std::string body;
    put_u16(body, packet_id);
    for (const auto &p : patterns) {
        put_str(body, p);
        body.push_back(static_cast<char>(0));  // requested QoS 0
    }
    // SUBSCRIBE carries fixed flags 0b0010
    return frame(MqttPacketType::Subscribe, 0x02, body);
}

std::string mqtt_puback(uint16_t packet_id) {
    std::string body;
    put_u16(body, packet_id);
    return frame(MqttPacketType::Puback, 0, body);
}

std::string mqtt_pingreq() {
    return frame(MqttPacketType::Pingreq, 0, std::string());
}

std::string mqtt_disconnect() {
    return frame(MqttPacketType::Disconnect, 0, std::string());
}

std::optional<uint8_t> mqtt_connack_code(const MqttPacket &p) {
    if (p.type != MqttPacketType::Connack || p.body.size() < 2) return std::nullopt;
    return static_cast<uint8_t>(p.body[1]);
}

MqttPublish mqtt_parse_publish(const MqttPacket &p) {
    if (p.type != MqttPacketType::Publish) throw MqttProtocolError("not a PUBLISH packet");
    if (p.body.size() < 2) throw MqttProtocolError("PUBLISH without topic");

    MqttPublish pub;
    pub.qos = static_cast<uint8_t>((p.flags >> 1) & 0x03);
    size_t tlen = get_u16(p.body, 0);
    size_t pos = 2;
    if (pos + tlen > p.body.size()) throw MqttProtocolError("PUBLISH topic truncated");
    pub.topic = p.body.substr(pos, tlen);
    pos += tlen;
    if (pub.qos > 0) {
        if (pos + 2 > p.body.size()) throw MqttProtocolError("PUBLISH packet id truncated");
        pub.packet_id = get_u16(p.body, pos);
        pos += 2;
    }
    pub.payload = p.body.substr(pos);
    return pub;
}

std::optional<MqttPacket> MqttFrameDecoder::next() {
    if (buf_.size() < 2) return std::nullopt;

    size_t remaining = 0;
    size_t multiplier = 1;
    size_t pos = 1;
    while (true) {
        if (pos > 4) throw MqttProtocolError("malformed remaining length");
        if (pos >= buf_.size()) return std::nullopt;
        uint8_t byte = static_cast<uint8_t>(buf_[pos]);
        remaining += (byte & 0x7F) * multiplier;
        multiplier *= 128;
        ++pos;
        if ((byte & 0x80) == 0) break;
    }
    if (remaining > kMqttMaxPacket) throw MqttProtocolError("packet exceeds size limit");
    if (buf_.size() < pos + remaining) return std::nullopt;

    uint8_t header = static_cast<uint8_t>(buf_[0]);
    MqttPacket p;
    p.type = static_cast<MqttPacketType>(header >> 4);
    p.flags = static_cast<uint8_t>(header & 0x0F);
    p.body = buf_.substr(pos, remaining);
    buf_.erase(0, pos + remaining);
    return p;
}
