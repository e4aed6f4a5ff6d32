#include "crier/core/Orchestrator.hpp"

#include "crier/log/StructuredLogger.hpp"
#include "crier/network/DirectTransport.hpp"
#include "crier/network/RelayTransport.hpp"
#include "crier/network/Socket.hpp"
#include "crier/protocol/Mqtt.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace crier::core {

namespace {

using log::StructuredLogger;

Outcome config_error(std::string detail) {
    return Outcome::failed(FailureKind::ConfigError, std::move(detail));
}

std::optional<Outcome> validate_direct(const Operation& operation, const DirectTarget& target) {
    if (target.address.empty()) {
        return config_error("Direct transport requires an address");
    }
    const auto endpoint = network::parse_endpoint(target.address);
    if (!endpoint) {
        return config_error("Invalid address '" + target.address + "' (expected HOST:PORT)");
    }
    if (operation.role == Role::Sender && endpoint->port == 0) {
        return config_error("Cannot send to port 0");
    }
    return std::nullopt;
}

std::optional<Outcome> validate_relay(const Operation& operation, const RelayTarget& target) {
    if (target.broker.empty()) {
        return config_error("Relay transport requires a broker host");
    }
    if (target.port == 0) {
        return config_error("Relay broker port must be between 1 and 65535");
    }
    if (target.topic.empty()) {
        return config_error("Relay transport requires a topic");
    }
    if (target.topic.size() > protocol::mqtt::kMaxStringLength) {
        return config_error("Topic of " + std::to_string(target.topic.size()) +
                            " bytes exceeds the MQTT limit of 65535");
    }
    if (operation.role == Role::Sender && network::has_topic_wildcard(target.topic)) {
        return config_error("Cannot publish to wildcard topic '" + target.topic + "'");
    }
    return std::nullopt;
}

std::string describe_target(const TransportTarget& target) {
    return std::visit(
        [](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, DirectTarget>) {
                return "direct " + value.address;
            } else if constexpr (std::is_same_v<T, RelayTarget>) {
                return "relay " + value.broker + ":" + std::to_string(value.port) + " topic " + value.topic;
            } else {
                return "none";
            }
        },
        target);
}

}  // namespace

std::optional<Outcome> validate(const Operation& operation) {
    if (std::holds_alternative<std::monostate>(operation.transport)) {
        return config_error("No transport specified (use a direct address or a relay broker and topic)");
    }
    if (const auto* direct = std::get_if<DirectTarget>(&operation.transport)) {
        return validate_direct(operation, *direct);
    }
    return validate_relay(operation, std::get<RelayTarget>(operation.transport));
}

std::unique_ptr<network::Transport> make_transport(const TransportTarget& target, const Config& config) {
    if (const auto* direct = std::get_if<DirectTarget>(&target)) {
        auto endpoint = network::parse_endpoint(direct->address);
        if (!endpoint) {
            return nullptr;
        }
        return std::make_unique<network::DirectTransport>(config, std::move(*endpoint));
    }
    if (const auto* relay = std::get_if<RelayTarget>(&target)) {
        return std::make_unique<network::RelayTransport>(config, *relay);
    }
    return nullptr;
}

Outcome run_operation(const Operation& operation,
                      const Config& config,
                      dispatch::CommandRunner& runner,
                      const StopSignal& stop) {
    if (auto invalid = validate(operation)) {
        log::log_event(StructuredLogger::Level::Error, "core.operation.invalid", {{"detail", invalid->detail}});
        return *invalid;
    }

    auto transport = make_transport(operation.transport, config);
    if (!transport) {
        return config_error("Unable to resolve transport " + describe_target(operation.transport));
    }

    log::log_event(StructuredLogger::Level::Debug,
                   "core.operation.start",
                   {{"role", std::string(to_string(operation.role))},
                    {"transport", describe_target(operation.transport)},
                    {"auth", operation.auth ? "enabled" : "disabled"}});

    Outcome outcome{};
    if (operation.role == Role::Listener) {
        dispatch::Dispatcher dispatcher(operation.payload_or_template, runner);
        outcome = transport->listen(operation.auth, dispatcher, stop);
    } else {
        Envelope envelope{};
        envelope.auth = operation.auth;
        envelope.message = operation.payload_or_template;
        outcome = transport->send(envelope);
    }

    if (!outcome.ok()) {
        log::log_event(StructuredLogger::Level::Error,
                       "core.operation.failed",
                       {{"role", std::string(to_string(operation.role))},
                        {"kind", std::string(to_string(outcome.failure))},
                        {"detail", outcome.detail}});
    }
    return outcome;
}

}  // namespace crier::core
