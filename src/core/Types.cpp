#include "crier/Types.hpp"

#include <utility>

namespace crier {

std::string_view to_string(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::None:
            return "None";
        case FailureKind::ConfigError:
            return "ConfigError";
        case FailureKind::ConnectError:
            return "ConnectError";
        case FailureKind::AuthError:
            return "AuthError";
        case FailureKind::TimeoutError:
            return "TimeoutError";
        case FailureKind::ProtocolError:
            return "ProtocolError";
    }
    return "None";
}

std::string_view to_string(Role role) noexcept {
    switch (role) {
        case Role::Listener:
            return "listener";
        case Role::Sender:
            return "sender";
    }
    return "sender";
}

Outcome Outcome::success(std::string detail) {
    Outcome outcome{};
    outcome.detail = std::move(detail);
    return outcome;
}

Outcome Outcome::failed(FailureKind kind, std::string detail) {
    Outcome outcome{};
    outcome.failure = kind;
    outcome.detail = std::move(detail);
    return outcome;
}

}  // namespace crier
