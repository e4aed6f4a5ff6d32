#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace crier::protocol::mqtt {

inline constexpr std::uint8_t kProtocolLevel = 4;  // MQTT 3.1.1
inline constexpr std::size_t kMaxRemainingLength = 268'435'455;
inline constexpr std::size_t kMaxStringLength = 0xFFFF;

enum class PacketType : std::uint8_t {
    Connect = 1,
    ConnAck = 2,
    Publish = 3,
    PubAck = 4,
    Subscribe = 8,
    SubAck = 9,
    PingReq = 12,
    PingResp = 13,
    Disconnect = 14,
};

enum class QoS : std::uint8_t {
    AtMostOnce = 0,
    AtLeastOnce = 1,
};

inline constexpr std::uint8_t kSubAckFailure = 0x80;

struct Packet {
    PacketType type{PacketType::PingReq};
    std::uint8_t flags{0};
    std::vector<std::uint8_t> body;
};

struct ConnectPacket {
    std::string client_id;
    std::chrono::seconds keep_alive{0};
    bool clean_session{true};
};

struct ConnAckPacket {
    bool session_present{false};
    std::uint8_t return_code{0};
};

struct PublishPacket {
    std::string topic;
    std::string payload;
    QoS qos{QoS::AtMostOnce};
    std::uint16_t packet_id{0};
    bool retain{false};
    bool dup{false};
};

struct SubscribePacket {
    std::uint16_t packet_id{0};
    std::string topic;
    QoS qos{QoS::AtMostOnce};
};

struct SubAckPacket {
    std::uint16_t packet_id{0};
    std::vector<std::uint8_t> return_codes;
};

// Encoders throw std::length_error for a string over kMaxStringLength bytes
// or a body over kMaxRemainingLength bytes.
std::vector<std::uint8_t> encode_remaining_length(std::size_t length);

// Whether a PUBLISH with this topic and payload size can be framed at all.
bool publish_fits(std::string_view topic, std::size_t payload_size, QoS qos) noexcept;

std::vector<std::uint8_t> encode_connect(const ConnectPacket& packet);
std::vector<std::uint8_t> encode_connack(const ConnAckPacket& packet);
std::vector<std::uint8_t> encode_publish(const PublishPacket& packet);
std::vector<std::uint8_t> encode_puback(std::uint16_t packet_id);
std::vector<std::uint8_t> encode_subscribe(const SubscribePacket& packet);
std::vector<std::uint8_t> encode_suback(const SubAckPacket& packet);
std::vector<std::uint8_t> encode_pingreq();
std::vector<std::uint8_t> encode_pingresp();
std::vector<std::uint8_t> encode_disconnect();

std::optional<ConnectPacket> decode_connect(const Packet& packet);
std::optional<ConnAckPacket> decode_connack(const Packet& packet);
std::optional<PublishPacket> decode_publish(const Packet& packet);
std::optional<std::uint16_t> decode_puback(const Packet& packet);
std::optional<SubscribePacket> decode_subscribe(const Packet& packet);
std::optional<SubAckPacket> decode_suback(const Packet& packet);

std::string_view connack_reason(std::uint8_t return_code) noexcept;
std::string_view packet_type_name(PacketType type) noexcept;

// Reassembles packets from an arbitrary chunking of the byte stream.
class PacketReader {
public:
    void feed(std::span<const std::uint8_t> bytes);

    // nullopt: need more bytes (or failed(), once the stream is malformed).
    std::optional<Packet> next();

    [[nodiscard]] bool failed() const noexcept { return failed_; }
    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }

private:
    std::deque<std::uint8_t> buffer_;
    bool failed_{false};
};

}  // namespace crier::protocol::mqtt
