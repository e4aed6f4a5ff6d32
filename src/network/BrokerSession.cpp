#include "crier/network/BrokerSession.hpp"

#include "crier/log/StructuredLogger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <utility>

#ifndef _WIN32
#include <sys/socket.h>
#include <sys/types.h>
#endif

namespace crier::network {

namespace mqtt = protocol::mqtt;

namespace {

using log::StructuredLogger;

constexpr std::size_t kReceiveChunk = 4096;

}  // namespace

BrokerSession::BrokerSession(Settings settings) : settings_(std::move(settings)) {}

BrokerSession::~BrokerSession() {
    disconnect();
}

Outcome BrokerSession::open() {
    socket_.reset();
    reader_ = mqtt::PacketReader{};
    pending_.clear();
    events_.clear();
    connected_ = false;

    const auto target = describe_endpoint(settings_.broker);
    auto socket = open_connection(settings_.broker);
    if (!socket) {
        return Outcome::failed(FailureKind::ConnectError,
                               format_socket_error("Failed to connect to broker " + target));
    }
    socket_ = std::move(socket);

    mqtt::ConnectPacket connect{};
    connect.client_id = settings_.client_id;
    connect.keep_alive = settings_.keep_alive;
    connect.clean_session = true;
    if (!write(mqtt::encode_connect(connect))) {
        const auto detail = format_socket_error("Failed to send CONNECT to broker " + target);
        socket_.reset();
        return Outcome::failed(FailureKind::ConnectError, detail);
    }

    log::log_event(StructuredLogger::Level::Debug,
                   "relay.session.opened",
                   {{"broker", target}, {"client_id", settings_.client_id}});
    return Outcome::success(target);
}

std::uint16_t BrokerSession::subscribe(const std::string& topic, mqtt::QoS qos) {
    mqtt::SubscribePacket packet{};
    packet.packet_id = next_packet_id();
    packet.topic = topic;
    packet.qos = qos;
    enqueue(PendingWrite{mqtt::encode_subscribe(packet), std::nullopt});
    return packet.packet_id;
}

std::uint64_t BrokerSession::publish(const std::string& topic, std::string payload, mqtt::QoS qos) {
    mqtt::PublishPacket packet{};
    packet.topic = topic;
    packet.payload = std::move(payload);
    packet.qos = qos;
    if (qos != mqtt::QoS::AtMostOnce) {
        packet.packet_id = next_packet_id();
    }

    OutgoingPublish completion{};
    completion.sequence = ++publish_sequence_;
    completion.topic = topic;
    enqueue(PendingWrite{mqtt::encode_publish(packet), completion});
    return completion.sequence;
}

std::optional<BrokerEvent> BrokerSession::next_event(std::chrono::milliseconds wait) {
    if (!events_.empty()) {
        auto event = std::move(events_.front());
        events_.pop_front();
        return event;
    }
    if (!socket_) {
        return ConnectionLost{"session is not open"};
    }

    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (events_.empty()) {
        maybe_ping();
        if (!events_.empty() || !socket_) {
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (connected_ && settings_.keep_alive.count() > 0) {
            const auto until_ping = std::chrono::duration_cast<std::chrono::milliseconds>(
                last_write_ + settings_.keep_alive - now);
            slice = std::min(slice, until_ping);
        }
        slice = std::max(slice, std::chrono::milliseconds{0});

        if (wait_readable(socket_.get(), slice)) {
            std::array<std::uint8_t, kReceiveChunk> chunk{};
#ifdef _WIN32
            const auto received = ::recv(socket_.get(), reinterpret_cast<char*>(chunk.data()),
                                         static_cast<int>(chunk.size()), 0);
#else
            const auto received = ::recv(socket_.get(), chunk.data(), chunk.size(), 0);
#endif
            if (received < 0 && last_socket_error() == EINTR) {
                continue;
            }
            if (received <= 0) {
                fail(received == 0 ? std::string{"Broker closed the connection"}
                                   : format_socket_error("Broker connection failed"));
                break;
            }

            reader_.feed(std::span<const std::uint8_t>(chunk.data(), static_cast<std::size_t>(received)));
            while (socket_) {
                auto packet = reader_.next();
                if (!packet) {
                    break;
                }
                handle_packet(*packet);
            }
            if (socket_ && reader_.failed()) {
                fail("Malformed packet received from broker");
            }
        }

        if (events_.empty() && std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
    }

    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void BrokerSession::disconnect() {
    if (!socket_) {
        return;
    }
    if (connected_ && !write(mqtt::encode_disconnect())) {
        log::log_event(StructuredLogger::Level::Debug,
                       "relay.session.disconnect_failed",
                       {{"detail", format_socket_error("send failed")}});
    }
    socket_.reset();
    connected_ = false;
    pending_.clear();
    log::log_event(StructuredLogger::Level::Debug,
                   "relay.session.closed",
                   {{"client_id", settings_.client_id}});
}

void BrokerSession::enqueue(PendingWrite pending) {
    if (!connected_) {
        pending_.push_back(std::move(pending));
        return;
    }
    if (!write(pending.bytes)) {
        fail(format_socket_error("Failed to write to broker"));
        return;
    }
    if (pending.completion) {
        events_.push_back(std::move(*pending.completion));
    }
}

void BrokerSession::flush_pending() {
    while (!pending_.empty()) {
        auto pending = std::move(pending_.front());
        pending_.pop_front();
        if (!write(pending.bytes)) {
            fail(format_socket_error("Failed to write to broker"));
            return;
        }
        if (pending.completion) {
            events_.push_back(std::move(*pending.completion));
        }
    }
}

bool BrokerSession::write(const std::vector<std::uint8_t>& bytes) {
    if (!socket_ || !send_all(socket_.get(), bytes.data(), bytes.size())) {
        return false;
    }
    last_write_ = std::chrono::steady_clock::now();
    return true;
}

void BrokerSession::handle_packet(const mqtt::Packet& packet) {
    switch (packet.type) {
        case mqtt::PacketType::ConnAck: {
            const auto connack = mqtt::decode_connack(packet);
            if (!connack) {
                fail("Malformed CONNACK from broker");
                return;
            }
            if (connack->return_code != 0) {
                fail("Broker refused connection: " + std::string(mqtt::connack_reason(connack->return_code)));
                return;
            }
            connected_ = true;
            events_.push_back(ConnAckEvent{connack->session_present});
            flush_pending();
            return;
        }
        case mqtt::PacketType::SubAck: {
            auto suback = mqtt::decode_suback(packet);
            if (!suback) {
                fail("Malformed SUBACK from broker");
                return;
            }
            events_.push_back(SubAckEvent{suback->packet_id, std::move(suback->return_codes)});
            return;
        }
        case mqtt::PacketType::Publish: {
            auto publish = mqtt::decode_publish(packet);
            if (!publish) {
                fail("Malformed PUBLISH from broker");
                return;
            }
            if (publish->qos == mqtt::QoS::AtLeastOnce && !write(mqtt::encode_puback(publish->packet_id))) {
                fail(format_socket_error("Failed to acknowledge PUBLISH"));
                return;
            }
            events_.push_back(IncomingPublish{std::move(publish->topic), std::move(publish->payload), publish->qos});
            return;
        }
        case mqtt::PacketType::PubAck: {
            const auto id = mqtt::decode_puback(packet);
            if (!id) {
                fail("Malformed PUBACK from broker");
                return;
            }
            events_.push_back(PubAckEvent{*id});
            return;
        }
        case mqtt::PacketType::PingResp:
            events_.push_back(PingRespEvent{});
            return;
        default:
            log::log_event(StructuredLogger::Level::Debug,
                           "relay.packet.ignored",
                           {{"type", std::string(mqtt::packet_type_name(packet.type))}});
            return;
    }
}

void BrokerSession::fail(std::string detail) {
    log::log_event(StructuredLogger::Level::Warning,
                   "relay.session.lost",
                   {{"broker", describe_endpoint(settings_.broker)}, {"detail", detail}});
    socket_.reset();
    connected_ = false;
    pending_.clear();
    events_.push_back(ConnectionLost{std::move(detail)});
}

void BrokerSession::maybe_ping() {
    if (!connected_ || settings_.keep_alive.count() <= 0) {
        return;
    }
    if (std::chrono::steady_clock::now() - last_write_ < settings_.keep_alive) {
        return;
    }
    if (!write(mqtt::encode_pingreq())) {
        fail(format_socket_error("Failed to send PINGREQ"));
    }
}

std::uint16_t BrokerSession::next_packet_id() {
    ++last_packet_id_;
    if (last_packet_id_ == 0) {
        last_packet_id_ = 1;
    }
    return last_packet_id_;
}

}  // namespace crier::network
