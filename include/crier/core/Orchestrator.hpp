#pragma once

#include "crier/Config.hpp"
#include "crier/Types.hpp"
#include "crier/dispatch/Dispatcher.hpp"
#include "crier/network/Transport.hpp"

#include <memory>
#include <optional>

namespace crier::core {

// Configuration failure for an operation that must not touch the network.
std::optional<Outcome> validate(const Operation& operation);

// Null when the target is monostate.
std::unique_ptr<network::Transport> make_transport(const TransportTarget& target, const Config& config);

// Resolves role x transport into one of the four delivery paths and runs it.
// Listener roles return once stop is requested; sender roles return after one delivery attempt.
Outcome run_operation(const Operation& operation,
                      const Config& config,
                      dispatch::CommandRunner& runner,
                      const StopSignal& stop);

}  // namespace crier::core
