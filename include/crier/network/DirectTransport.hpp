#pragma once

#include "crier/Config.hpp"
#include "crier/network/Socket.hpp"
#include "crier/network/Transport.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace crier::network {

class DirectTransport final : public Transport {
public:
    DirectTransport(const Config& config, Endpoint endpoint);

    DirectTransport(const DirectTransport&) = delete;
    DirectTransport& operator=(const DirectTransport&) = delete;

    const protocol::EnvelopeCodec& codec() const noexcept override { return codec_; }

    // Binds the listening socket; listen() binds on demand when this was not called.
    Outcome bind();
    [[nodiscard]] std::optional<std::uint16_t> bound_port() const;

    Outcome listen(const std::optional<std::string>& expected_auth,
                   dispatch::Dispatcher& dispatcher,
                   const StopSignal& stop) override;

    Outcome send(const Envelope& envelope) override;

private:
    void handle_connection(ScopedSocket client,
                           const std::optional<std::string>& expected_auth,
                           dispatch::Dispatcher& dispatcher);

    const Config& config_;
    Endpoint endpoint_;
    protocol::LineEnvelopeCodec codec_{};
    ScopedSocket listen_socket_{};
};

}  // namespace crier::network
