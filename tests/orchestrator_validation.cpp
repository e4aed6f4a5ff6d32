#include "crier/Config.hpp"
#include "crier/core/Orchestrator.hpp"
#include "crier/network/Socket.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

using crier::FailureKind;
using crier::Operation;
using crier::Role;

namespace {

class CountingRunner final : public crier::dispatch::CommandRunner {
public:
    crier::dispatch::ExecutionOutcome run(const std::string& command) override {
        commands.push_back(command);
        return crier::dispatch::ExecutionOutcome::completed(0);
    }

    std::vector<std::string> commands;
};

Operation direct(Role role, std::string address, std::string payload) {
    Operation operation{};
    operation.role = role;
    operation.transport = crier::DirectTarget{std::move(address)};
    operation.payload_or_template = std::move(payload);
    return operation;
}

Operation relay(Role role, std::string broker, std::uint16_t port, std::string topic, std::string payload) {
    Operation operation{};
    operation.role = role;
    operation.transport = crier::RelayTarget{std::move(broker), port, std::move(topic)};
    operation.payload_or_template = std::move(payload);
    return operation;
}

FailureKind invalid_kind(const Operation& operation) {
    const auto invalid = crier::core::validate(operation);
    return invalid ? invalid->failure : FailureKind::None;
}

// A loopback port nothing listens on once this returns.
std::uint16_t closed_port() {
    auto listener = crier::network::open_listener(crier::network::Endpoint{"127.0.0.1", 0}, 1);
    assert(listener);
    return *crier::network::local_port(listener.get());
}

}  // namespace

int main() {
    Operation unresolved{};
    unresolved.payload_or_template = "hello";
    assert(invalid_kind(unresolved) == FailureKind::ConfigError);

    // Empty text is a valid message and a valid template.
    assert(invalid_kind(direct(Role::Sender, "127.0.0.1:9000", "")) == FailureKind::None);
    assert(invalid_kind(direct(Role::Listener, "0.0.0.0:9000", "")) == FailureKind::None);
    assert(invalid_kind(direct(Role::Listener, "[::]:9000", "echo {}")) == FailureKind::None);
    assert(invalid_kind(direct(Role::Sender, "[::1]:9000", "hello")) == FailureKind::None);
    assert(invalid_kind(direct(Role::Sender, "::1:9000", "hello")) == FailureKind::ConfigError);
    assert(invalid_kind(direct(Role::Sender, "", "hello")) == FailureKind::ConfigError);
    assert(invalid_kind(direct(Role::Sender, "localhost", "hello")) == FailureKind::ConfigError);
    assert(invalid_kind(direct(Role::Sender, "localhost:http", "hello")) == FailureKind::ConfigError);
    assert(invalid_kind(direct(Role::Sender, "localhost:70000", "hello")) == FailureKind::ConfigError);
    assert(invalid_kind(direct(Role::Sender, "127.0.0.1:0", "hello")) == FailureKind::ConfigError);
    assert(invalid_kind(direct(Role::Listener, "127.0.0.1:0", "echo {}")) == FailureKind::None);
    assert(invalid_kind(direct(Role::Sender, "127.0.0.1:9000", "hello")) == FailureKind::None);

    assert(invalid_kind(relay(Role::Sender, "", 1883, "alerts", "hello")) == FailureKind::ConfigError);
    assert(invalid_kind(relay(Role::Sender, "broker.local", 0, "alerts", "hello")) == FailureKind::ConfigError);
    assert(invalid_kind(relay(Role::Listener, "broker.local", 1883, "", "echo {}")) == FailureKind::ConfigError);
    assert(invalid_kind(relay(Role::Sender, "broker.local", 1883, "alerts/#", "hello")) == FailureKind::ConfigError);
    assert(invalid_kind(relay(Role::Listener, "broker.local", 1883, "alerts/#", "echo {}")) == FailureKind::None);
    assert(invalid_kind(relay(Role::Sender, "broker.local", 1883, "alerts", "")) == FailureKind::None);
    assert(invalid_kind(relay(Role::Listener, "broker.local", 1883, std::string(70000, 'a'), "echo {}")) ==
           FailureKind::ConfigError);
    assert(invalid_kind(relay(Role::Sender, "broker.local", 1883, std::string(65535, 'a'), "hi")) == FailureKind::None);

    crier::Config config{};
    config.stop_poll_interval = 20ms;
    crier::StopSignal stop;

    {
        // Invalid operations fail before any name resolution or connect attempt.
        CountingRunner runner;
        const auto outcome = crier::core::run_operation(
            relay(Role::Sender, "unresolvable.invalid", 1883, "a/+", "hello"), config, runner, stop);
        assert(outcome.failure == FailureKind::ConfigError);
        assert(outcome.detail.find("wildcard") != std::string::npos);
    }

    assert(!crier::core::make_transport(crier::TransportTarget{}, config));
    assert(crier::core::make_transport(crier::DirectTarget{"127.0.0.1:9000"}, config));
    assert(crier::core::make_transport(crier::RelayTarget{"127.0.0.1", 1883, "alerts"}, config));

    {
        CountingRunner runner;
        const auto address = "127.0.0.1:" + std::to_string(closed_port());
        const auto outcome =
            crier::core::run_operation(direct(Role::Sender, address, "hello"), config, runner, stop);
        assert(outcome.failure == FailureKind::ConnectError);
    }

    {
        CountingRunner runner;
        const auto outcome = crier::core::run_operation(
            relay(Role::Sender, "127.0.0.1", closed_port(), "alerts", "hello"), config, runner, stop);
        assert(outcome.failure == FailureKind::ConnectError);
    }

    {
        // Address already in use.
        auto occupied = crier::network::open_listener(crier::network::Endpoint{"127.0.0.1", 0}, 1);
        assert(occupied);
        const auto address = "127.0.0.1:" + std::to_string(*crier::network::local_port(occupied.get()));
        CountingRunner runner;
        const auto outcome =
            crier::core::run_operation(direct(Role::Listener, address, "echo {}"), config, runner, stop);
        assert(outcome.failure == FailureKind::ConnectError);
        assert(runner.commands.empty());
    }

    {
        CountingRunner runner;
        crier::StopSignal listener_stop;
        crier::Outcome outcome{};
        std::thread listener([&]() {
            outcome = crier::core::run_operation(
                direct(Role::Listener, "127.0.0.1:0", "echo {}"), config, runner, listener_stop);
        });
        std::this_thread::sleep_for(200ms);
        listener_stop.request_stop();
        listener.join();
        assert(outcome.ok());
        assert(runner.commands.empty());
    }

    {
        // A stop requested before the call still returns cleanly.
        CountingRunner runner;
        crier::StopSignal stopped;
        stopped.request_stop();
        const auto outcome = crier::core::run_operation(
            direct(Role::Listener, "127.0.0.1:0", "echo {}"), config, runner, stopped);
        assert(outcome.ok());
    }

    return 0;
}
