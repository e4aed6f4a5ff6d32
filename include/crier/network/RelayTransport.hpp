#pragma once

#include "crier/Config.hpp"
#include "crier/network/BrokerSession.hpp"
#include "crier/network/Transport.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace crier::network {

// Publish/subscribe delivery through an MQTT broker. Each call to listen() or
// send() owns its own BrokerSession for the duration of the call.
class RelayTransport final : public Transport {
public:
    RelayTransport(const Config& config, RelayTarget target);

    RelayTransport(const RelayTransport&) = delete;
    RelayTransport& operator=(const RelayTransport&) = delete;

    const protocol::EnvelopeCodec& codec() const noexcept override { return codec_; }

    Outcome listen(const std::optional<std::string>& expected_auth,
                   dispatch::Dispatcher& dispatcher,
                   const StopSignal& stop) override;

    Outcome send(const Envelope& envelope) override;

    [[nodiscard]] const RelayTarget& target() const noexcept { return target_; }

    // "<prefix>-<role>-<pid>"
    [[nodiscard]] std::string client_id(Role role) const;

private:
    BrokerSession::Settings session_settings(Role role) const;
    void handle_publish(const IncomingPublish& publish,
                        const std::optional<std::string>& expected_auth,
                        dispatch::Dispatcher& dispatcher);
    bool reconnect(BrokerSession& session, const StopSignal& stop);
    bool pause(std::chrono::milliseconds duration, const StopSignal& stop) const;
    Outcome topic_too_long() const;

    const Config& config_;
    RelayTarget target_;
    protocol::PayloadEnvelopeCodec codec_{};
};

[[nodiscard]] bool has_topic_wildcard(std::string_view topic) noexcept;

}  // namespace crier::network
