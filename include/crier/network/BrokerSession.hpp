#pragma once

#include "crier/Types.hpp"
#include "crier/network/Socket.hpp"
#include "crier/protocol/Mqtt.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace crier::network {

struct ConnAckEvent {
    bool session_present{false};
};

struct SubAckEvent {
    std::uint16_t packet_id{0};
    std::vector<std::uint8_t> return_codes;
};

struct IncomingPublish {
    std::string topic;
    std::string payload;
    protocol::mqtt::QoS qos{protocol::mqtt::QoS::AtMostOnce};
};

// Emitted once the publish has been fully written to the broker connection.
struct OutgoingPublish {
    std::uint64_t sequence{0};
    std::string topic;
};

struct PubAckEvent {
    std::uint16_t packet_id{0};
};

struct PingRespEvent {};

struct ConnectionLost {
    std::string detail;
};

using BrokerEvent = std::variant<ConnAckEvent,
                                 SubAckEvent,
                                 IncomingPublish,
                                 OutgoingPublish,
                                 PubAckEvent,
                                 PingRespEvent,
                                 ConnectionLost>;

// One MQTT client connection. Owned by the operation that drives it; nothing
// here is process-global, so independent sessions can coexist.
class BrokerSession {
public:
    struct Settings {
        Endpoint broker;
        std::string client_id;
        std::chrono::seconds keep_alive{30};
    };

    explicit BrokerSession(Settings settings);
    ~BrokerSession();

    BrokerSession(const BrokerSession&) = delete;
    BrokerSession& operator=(const BrokerSession&) = delete;

    // TCP connect and CONNECT. The CONNACK arrives later as a ConnAckEvent.
    Outcome open();

    // Queued until the broker accepted the connection, then written in order.
    std::uint16_t subscribe(const std::string& topic, protocol::mqtt::QoS qos);
    std::uint64_t publish(const std::string& topic, std::string payload, protocol::mqtt::QoS qos);

    // Next event of the session's event stream; nullopt when wait elapsed first.
    std::optional<BrokerEvent> next_event(std::chrono::milliseconds wait);

    void disconnect();

    [[nodiscard]] bool is_open() const noexcept { return socket_.valid(); }
    [[nodiscard]] bool connected() const noexcept { return connected_; }
    [[nodiscard]] const std::string& client_id() const noexcept { return settings_.client_id; }
    [[nodiscard]] const Endpoint& broker() const noexcept { return settings_.broker; }

private:
    struct PendingWrite {
        std::vector<std::uint8_t> bytes;
        std::optional<OutgoingPublish> completion;
    };

    void enqueue(PendingWrite write);
    void flush_pending();
    bool write(const std::vector<std::uint8_t>& bytes);
    void handle_packet(const protocol::mqtt::Packet& packet);
    void fail(std::string detail);
    void maybe_ping();
    std::uint16_t next_packet_id();

    Settings settings_;
    ScopedSocket socket_{};
    protocol::mqtt::PacketReader reader_{};
    std::deque<PendingWrite> pending_;
    std::deque<BrokerEvent> events_;
    bool connected_{false};
    std::uint16_t last_packet_id_{0};
    std::uint64_t publish_sequence_{0};
    std::chrono::steady_clock::time_point last_write_{};
};

}  // namespace crier::network
