#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace crier {

struct Envelope {
    std::optional<std::string> auth;
    std::string message;

    bool operator==(const Envelope&) const = default;
};

enum class Role {
    Listener,
    Sender
};

struct DirectTarget {
    std::string address;
};

struct RelayTarget {
    std::string broker;
    std::uint16_t port{1883};
    std::string topic;
};

// monostate: no transport was resolved by the caller.
using TransportTarget = std::variant<std::monostate, DirectTarget, RelayTarget>;

struct Operation {
    Role role{Role::Sender};
    TransportTarget transport{};
    // Sender: literal message. Listener: command template with "{}" placeholders.
    std::string payload_or_template;
    std::optional<std::string> auth{};
};

enum class FailureKind {
    None,
    ConfigError,
    ConnectError,
    AuthError,
    TimeoutError,
    ProtocolError
};

std::string_view to_string(FailureKind kind) noexcept;
std::string_view to_string(Role role) noexcept;

struct Outcome {
    FailureKind failure{FailureKind::None};
    std::string detail;

    [[nodiscard]] bool ok() const noexcept { return failure == FailureKind::None; }

    static Outcome success(std::string detail = {});
    static Outcome failed(FailureKind kind, std::string detail);
};

class StopSignal {
public:
    StopSignal() = default;

    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void request_stop() noexcept { stopped_.store(true, std::memory_order_release); }
    [[nodiscard]] bool stop_requested() const noexcept { return stopped_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> stopped_{false};
};

}  // namespace crier
