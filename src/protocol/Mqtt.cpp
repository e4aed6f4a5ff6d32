#include "crier/protocol/Mqtt.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace crier::protocol::mqtt {

namespace {

constexpr std::string_view kProtocolName{"MQTT"};
constexpr std::uint8_t kCleanSessionFlag = 0x02;
constexpr std::uint8_t kSubscribeFlags = 0x02;

void write_u16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void write_string(std::vector<std::uint8_t>& out, std::string_view value) {
    if (value.size() > kMaxStringLength) {
        throw std::length_error("MQTT string of " + std::to_string(value.size()) + " bytes exceeds 65535");
    }
    write_u16(out, static_cast<std::uint16_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

std::vector<std::uint8_t> frame(PacketType type, std::uint8_t flags, const std::vector<std::uint8_t>& body) {
    std::vector<std::uint8_t> out;
    const auto length = encode_remaining_length(body.size());
    out.reserve(1 + length.size() + body.size());
    out.push_back(static_cast<std::uint8_t>((static_cast<std::uint8_t>(type) << 4) | (flags & 0x0Fu)));
    out.insert(out.end(), length.begin(), length.end());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

class BodyCursor {
public:
    explicit BodyCursor(const std::vector<std::uint8_t>& body) : body_(body) {}

    std::optional<std::uint8_t> u8() {
        if (remaining() < 1) {
            return std::nullopt;
        }
        return body_[cursor_++];
    }

    std::optional<std::uint16_t> u16() {
        if (remaining() < 2) {
            return std::nullopt;
        }
        const auto value = static_cast<std::uint16_t>((body_[cursor_] << 8) | body_[cursor_ + 1]);
        cursor_ += 2;
        return value;
    }

    std::optional<std::string> string() {
        const auto length = u16();
        if (!length || remaining() < *length) {
            return std::nullopt;
        }
        std::string value(reinterpret_cast<const char*>(body_.data() + cursor_), *length);
        cursor_ += *length;
        return value;
    }

    std::string rest() {
        std::string value(reinterpret_cast<const char*>(body_.data() + cursor_), remaining());
        cursor_ = body_.size();
        return value;
    }

    [[nodiscard]] std::size_t remaining() const noexcept { return body_.size() - cursor_; }

private:
    const std::vector<std::uint8_t>& body_;
    std::size_t cursor_{0};
};

}  // namespace

std::vector<std::uint8_t> encode_remaining_length(std::size_t length) {
    if (length > kMaxRemainingLength) {
        throw std::length_error("MQTT remaining length " + std::to_string(length) + " exceeds 268435455");
    }
    std::vector<std::uint8_t> out;
    do {
        auto digit = static_cast<std::uint8_t>(length % 128);
        length /= 128;
        if (length > 0) {
            digit |= 0x80u;
        }
        out.push_back(digit);
    } while (length > 0);
    return out;
}

bool publish_fits(std::string_view topic, std::size_t payload_size, QoS qos) noexcept {
    if (topic.size() > kMaxStringLength) {
        return false;
    }
    const std::size_t header = 2 + topic.size() + (qos != QoS::AtMostOnce ? 2 : 0);
    return payload_size <= kMaxRemainingLength - header;
}

std::vector<std::uint8_t> encode_connect(const ConnectPacket& packet) {
    std::vector<std::uint8_t> body;
    write_string(body, kProtocolName);
    body.push_back(kProtocolLevel);
    body.push_back(packet.clean_session ? kCleanSessionFlag : 0);
    const auto keep_alive = std::clamp<std::int64_t>(packet.keep_alive.count(), 0, 0xFFFF);
    write_u16(body, static_cast<std::uint16_t>(keep_alive));
    write_string(body, packet.client_id);
    return frame(PacketType::Connect, 0, body);
}

std::vector<std::uint8_t> encode_connack(const ConnAckPacket& packet) {
    std::vector<std::uint8_t> body{static_cast<std::uint8_t>(packet.session_present ? 1 : 0),
                                   packet.return_code};
    return frame(PacketType::ConnAck, 0, body);
}

std::vector<std::uint8_t> encode_publish(const PublishPacket& packet) {
    std::vector<std::uint8_t> body;
    write_string(body, packet.topic);
    if (packet.qos != QoS::AtMostOnce) {
        write_u16(body, packet.packet_id);
    }
    body.insert(body.end(), packet.payload.begin(), packet.payload.end());

    std::uint8_t flags = static_cast<std::uint8_t>(static_cast<std::uint8_t>(packet.qos) << 1);
    if (packet.dup) {
        flags |= 0x08u;
    }
    if (packet.retain) {
        flags |= 0x01u;
    }
    return frame(PacketType::Publish, flags, body);
}

std::vector<std::uint8_t> encode_puback(std::uint16_t packet_id) {
    std::vector<std::uint8_t> body;
    write_u16(body, packet_id);
    return frame(PacketType::PubAck, 0, body);
}

std::vector<std::uint8_t> encode_subscribe(const SubscribePacket& packet) {
    std::vector<std::uint8_t> body;
    write_u16(body, packet.packet_id);
    write_string(body, packet.topic);
    body.push_back(static_cast<std::uint8_t>(packet.qos));
    return frame(PacketType::Subscribe, kSubscribeFlags, body);
}

std::vector<std::uint8_t> encode_suback(const SubAckPacket& packet) {
    std::vector<std::uint8_t> body;
    write_u16(body, packet.packet_id);
    body.insert(body.end(), packet.return_codes.begin(), packet.return_codes.end());
    return frame(PacketType::SubAck, 0, body);
}

std::vector<std::uint8_t> encode_pingreq() {
    return frame(PacketType::PingReq, 0, {});
}

std::vector<std::uint8_t> encode_pingresp() {
    return frame(PacketType::PingResp, 0, {});
}

std::vector<std::uint8_t> encode_disconnect() {
    return frame(PacketType::Disconnect, 0, {});
}

std::optional<ConnectPacket> decode_connect(const Packet& packet) {
    if (packet.type != PacketType::Connect) {
        return std::nullopt;
    }
    BodyCursor cursor(packet.body);
    const auto name = cursor.string();
    const auto level = cursor.u8();
    const auto flags = cursor.u8();
    const auto keep_alive = cursor.u16();
    if (!name || *name != kProtocolName || !level || !flags || !keep_alive) {
        return std::nullopt;
    }
    auto client_id = cursor.string();
    if (!client_id) {
        return std::nullopt;
    }
    ConnectPacket decoded{};
    decoded.client_id = std::move(*client_id);
    decoded.keep_alive = std::chrono::seconds(*keep_alive);
    decoded.clean_session = (*flags & kCleanSessionFlag) != 0;
    return decoded;
}

std::optional<ConnAckPacket> decode_connack(const Packet& packet) {
    if (packet.type != PacketType::ConnAck || packet.body.size() != 2) {
        return std::nullopt;
    }
    ConnAckPacket decoded{};
    decoded.session_present = (packet.body[0] & 0x01u) != 0;
    decoded.return_code = packet.body[1];
    return decoded;
}

std::optional<PublishPacket> decode_publish(const Packet& packet) {
    if (packet.type != PacketType::Publish) {
        return std::nullopt;
    }
    const auto qos_bits = static_cast<std::uint8_t>((packet.flags >> 1) & 0x03u);
    if (qos_bits > static_cast<std::uint8_t>(QoS::AtLeastOnce)) {
        return std::nullopt;
    }

    BodyCursor cursor(packet.body);
    auto topic = cursor.string();
    if (!topic) {
        return std::nullopt;
    }
    PublishPacket decoded{};
    decoded.topic = std::move(*topic);
    decoded.qos = static_cast<QoS>(qos_bits);
    decoded.retain = (packet.flags & 0x01u) != 0;
    decoded.dup = (packet.flags & 0x08u) != 0;
    if (decoded.qos != QoS::AtMostOnce) {
        const auto id = cursor.u16();
        if (!id) {
            return std::nullopt;
        }
        decoded.packet_id = *id;
    }
    decoded.payload = cursor.rest();
    return decoded;
}

std::optional<std::uint16_t> decode_puback(const Packet& packet) {
    if (packet.type != PacketType::PubAck) {
        return std::nullopt;
    }
    BodyCursor cursor(packet.body);
    return cursor.u16();
}

std::optional<SubscribePacket> decode_subscribe(const Packet& packet) {
    if (packet.type != PacketType::Subscribe || packet.flags != kSubscribeFlags) {
        return std::nullopt;
    }
    BodyCursor cursor(packet.body);
    const auto id = cursor.u16();
    auto topic = cursor.string();
    const auto qos = cursor.u8();
    if (!id || !topic || !qos || *qos > static_cast<std::uint8_t>(QoS::AtLeastOnce)) {
        return std::nullopt;
    }
    SubscribePacket decoded{};
    decoded.packet_id = *id;
    decoded.topic = std::move(*topic);
    decoded.qos = static_cast<QoS>(*qos);
    return decoded;
}

std::optional<SubAckPacket> decode_suback(const Packet& packet) {
    if (packet.type != PacketType::SubAck) {
        return std::nullopt;
    }
    BodyCursor cursor(packet.body);
    const auto id = cursor.u16();
    if (!id || cursor.remaining() == 0) {
        return std::nullopt;
    }
    SubAckPacket decoded{};
    decoded.packet_id = *id;
    while (const auto code = cursor.u8()) {
        decoded.return_codes.push_back(*code);
    }
    return decoded;
}

std::string_view connack_reason(std::uint8_t return_code) noexcept {
    switch (return_code) {
        case 0:
            return "accepted";
        case 1:
            return "unacceptable protocol version";
        case 2:
            return "identifier rejected";
        case 3:
            return "server unavailable";
        case 4:
            return "bad user name or password";
        case 5:
            return "not authorized";
        default:
            return "unknown return code";
    }
}

std::string_view packet_type_name(PacketType type) noexcept {
    switch (type) {
        case PacketType::Connect:
            return "CONNECT";
        case PacketType::ConnAck:
            return "CONNACK";
        case PacketType::Publish:
            return "PUBLISH";
        case PacketType::PubAck:
            return "PUBACK";
        case PacketType::Subscribe:
            return "SUBSCRIBE";
        case PacketType::SubAck:
            return "SUBACK";
        case PacketType::PingReq:
            return "PINGREQ";
        case PacketType::PingResp:
            return "PINGRESP";
        case PacketType::Disconnect:
            return "DISCONNECT";
    }
    return "UNKNOWN";
}

void PacketReader::feed(std::span<const std::uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

std::optional<Packet> PacketReader::next() {
    if (failed_ || buffer_.size() < 2) {
        return std::nullopt;
    }

    std::size_t remaining_length = 0;
    std::size_t multiplier = 1;
    std::size_t header_size = 1;
    while (true) {
        if (header_size > 4) {
            failed_ = true;
            return std::nullopt;
        }
        if (header_size >= buffer_.size()) {
            return std::nullopt;
        }
        const auto digit = buffer_[header_size++];
        remaining_length += static_cast<std::size_t>(digit & 0x7Fu) * multiplier;
        if ((digit & 0x80u) == 0) {
            break;
        }
        multiplier *= 128;
    }

    if (buffer_.size() < header_size + remaining_length) {
        return std::nullopt;
    }

    const auto first = buffer_.front();
    const auto type_bits = static_cast<std::uint8_t>(first >> 4);
    if (type_bits == 0 || type_bits == 15) {
        failed_ = true;
        return std::nullopt;
    }

    Packet packet{};
    packet.type = static_cast<PacketType>(type_bits);
    packet.flags = static_cast<std::uint8_t>(first & 0x0Fu);
    const auto body_begin = buffer_.begin() + static_cast<std::ptrdiff_t>(header_size);
    const auto body_end = body_begin + static_cast<std::ptrdiff_t>(remaining_length);
    packet.body.assign(body_begin, body_end);
    buffer_.erase(buffer_.begin(), body_end);
    return packet;
}

}  // namespace crier::protocol::mqtt
