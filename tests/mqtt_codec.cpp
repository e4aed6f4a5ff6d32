#include "crier/protocol/Mqtt.hpp"

#include <cassert>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace mqtt = crier::protocol::mqtt;

namespace {

mqtt::Packet read_one(const std::vector<std::uint8_t>& bytes) {
    mqtt::PacketReader reader;
    reader.feed(std::span<const std::uint8_t>(bytes.data(), bytes.size()));
    auto packet = reader.next();
    assert(packet.has_value());
    assert(reader.buffered() == 0);
    return *packet;
}

}  // namespace

int main() {
    assert((mqtt::encode_remaining_length(0) == std::vector<std::uint8_t>{0x00}));
    assert((mqtt::encode_remaining_length(127) == std::vector<std::uint8_t>{0x7F}));
    assert((mqtt::encode_remaining_length(128) == std::vector<std::uint8_t>{0x80, 0x01}));
    assert((mqtt::encode_remaining_length(16'383) == std::vector<std::uint8_t>{0xFF, 0x7F}));
    assert((mqtt::encode_remaining_length(mqtt::kMaxRemainingLength) ==
            std::vector<std::uint8_t>{0xFF, 0xFF, 0xFF, 0x7F}));

    {
        // Lengths the wire format cannot carry are refused, never truncated.
        bool threw = false;
        try {
            mqtt::encode_remaining_length(mqtt::kMaxRemainingLength + 1);
        } catch (const std::length_error&) {
            threw = true;
        }
        assert(threw);

        mqtt::PublishPacket publish{};
        publish.topic = std::string(70000, 't');
        publish.payload = "hi";
        threw = false;
        try {
            mqtt::encode_publish(publish);
        } catch (const std::length_error&) {
            threw = true;
        }
        assert(threw);

        assert(!mqtt::publish_fits(publish.topic, 2, mqtt::QoS::AtMostOnce));
        assert(mqtt::publish_fits(std::string(65535, 't'), 2, mqtt::QoS::AtMostOnce));
        assert(mqtt::publish_fits("a", mqtt::kMaxRemainingLength - 3, mqtt::QoS::AtMostOnce));
        assert(!mqtt::publish_fits("a", mqtt::kMaxRemainingLength - 2, mqtt::QoS::AtMostOnce));
        assert(!mqtt::publish_fits("a", mqtt::kMaxRemainingLength - 3, mqtt::QoS::AtLeastOnce));
    }

    // CONNECT wire layout for a 3.1.1 clean session.
    {
        mqtt::ConnectPacket connect{};
        connect.client_id = "crier-listener-1";
        connect.keep_alive = std::chrono::seconds(30);
        const auto bytes = mqtt::encode_connect(connect);
        assert(bytes[0] == 0x10);
        assert(bytes[2] == 0x00 && bytes[3] == 0x04);
        assert(std::string(bytes.begin() + 4, bytes.begin() + 8) == "MQTT");
        assert(bytes[8] == mqtt::kProtocolLevel);
        assert(bytes[9] == 0x02);
        assert(bytes[10] == 0x00 && bytes[11] == 30);

        const auto decoded = mqtt::decode_connect(read_one(bytes));
        assert(decoded && decoded->client_id == "crier-listener-1");
        assert(decoded->keep_alive == std::chrono::seconds(30));
        assert(decoded->clean_session);
    }

    // QoS 0 publishes carry no packet identifier.
    {
        mqtt::PublishPacket publish{};
        publish.topic = "crier/alerts";
        publish.payload = "AUTH:secret:ping";
        const auto bytes = mqtt::encode_publish(publish);
        assert(bytes[0] == 0x30);
        assert(bytes[1] == 2 + publish.topic.size() + publish.payload.size());

        const auto decoded = mqtt::decode_publish(read_one(bytes));
        assert(decoded && decoded->topic == "crier/alerts");
        assert(decoded->payload == "AUTH:secret:ping");
        assert(decoded->qos == mqtt::QoS::AtMostOnce);
    }
    {
        mqtt::PublishPacket publish{};
        publish.topic = "t";
        publish.payload = "x";
        publish.qos = mqtt::QoS::AtLeastOnce;
        publish.packet_id = 0x1234;
        const auto bytes = mqtt::encode_publish(publish);
        assert(bytes[0] == 0x32);
        const auto decoded = mqtt::decode_publish(read_one(bytes));
        assert(decoded && decoded->packet_id == 0x1234 && decoded->payload == "x");
    }

    {
        mqtt::SubscribePacket subscribe{};
        subscribe.packet_id = 7;
        subscribe.topic = "crier/#";
        subscribe.qos = mqtt::QoS::AtLeastOnce;
        const auto bytes = mqtt::encode_subscribe(subscribe);
        assert(bytes[0] == 0x82);
        const auto decoded = mqtt::decode_subscribe(read_one(bytes));
        assert(decoded && decoded->packet_id == 7 && decoded->topic == "crier/#");
        assert(decoded->qos == mqtt::QoS::AtLeastOnce);
    }
    {
        mqtt::SubAckPacket suback{};
        suback.packet_id = 7;
        suback.return_codes = {0x01, mqtt::kSubAckFailure};
        const auto decoded = mqtt::decode_suback(read_one(mqtt::encode_suback(suback)));
        assert(decoded && decoded->packet_id == 7);
        assert((decoded->return_codes == std::vector<std::uint8_t>{0x01, 0x80}));
    }
    {
        mqtt::ConnAckPacket connack{};
        connack.return_code = 5;
        const auto decoded = mqtt::decode_connack(read_one(mqtt::encode_connack(connack)));
        assert(decoded && decoded->return_code == 5);
        assert(mqtt::connack_reason(5) == "not authorized");
    }
    assert(mqtt::decode_puback(read_one(mqtt::encode_puback(42))) == std::uint16_t{42});
    assert(read_one(mqtt::encode_pingreq()).type == mqtt::PacketType::PingReq);
    assert(read_one(mqtt::encode_disconnect()).type == mqtt::PacketType::Disconnect);

    // Decoders reject packets of another type.
    assert(!mqtt::decode_connack(read_one(mqtt::encode_pingresp())));

    // Byte-at-a-time delivery reassembles several packets in order.
    {
        std::vector<std::uint8_t> stream = mqtt::encode_connack(mqtt::ConnAckPacket{});
        const auto ping = mqtt::encode_pingresp();
        stream.insert(stream.end(), ping.begin(), ping.end());

        mqtt::PacketReader reader;
        std::vector<mqtt::PacketType> seen;
        for (const auto byte : stream) {
            reader.feed(std::span<const std::uint8_t>(&byte, 1));
            while (auto packet = reader.next()) {
                seen.push_back(packet->type);
            }
        }
        assert((seen == std::vector<mqtt::PacketType>{mqtt::PacketType::ConnAck, mqtt::PacketType::PingResp}));
        assert(!reader.failed());
    }

    // A remaining length longer than four bytes is malformed.
    {
        const std::vector<std::uint8_t> bad{0x30, 0xFF, 0xFF, 0xFF, 0xFF, 0x01};
        mqtt::PacketReader reader;
        reader.feed(std::span<const std::uint8_t>(bad.data(), bad.size()));
        assert(!reader.next());
        assert(reader.failed());
    }

    return 0;
}
