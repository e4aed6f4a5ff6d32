#pragma once

#include "crier/Types.hpp"
#include "crier/dispatch/Dispatcher.hpp"
#include "crier/protocol/Envelope.hpp"

#include <optional>
#include <string>

namespace crier::network {

class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual const protocol::EnvelopeCodec& codec() const noexcept = 0;

    // Runs until stop is requested (success) or the transport cannot be established.
    virtual Outcome listen(const std::optional<std::string>& expected_auth,
                           dispatch::Dispatcher& dispatcher,
                           const StopSignal& stop) = 0;

    virtual Outcome send(const Envelope& envelope) = 0;
};

}  // namespace crier::network
