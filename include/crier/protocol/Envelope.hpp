#pragma once

#include "crier/Types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace crier::protocol {

inline constexpr std::string_view kAuthPrefix{"AUTH:"};
inline constexpr std::string_view kAckLine{"OK"};
inline constexpr std::string_view kAuthRejectedLine{"ERR:AUTH"};

enum class DecodeError {
    Auth,
    Format
};

std::string_view to_string(DecodeError error) noexcept;

using DecodeResult = std::variant<Envelope, DecodeError>;

// Pulls the next line (terminator stripped); nullopt at end of stream.
using LineSource = std::function<std::optional<std::string>()>;

class EnvelopeCodec {
public:
    virtual ~EnvelopeCodec() = default;

    [[nodiscard]] virtual std::string encode(const Envelope& envelope) const = 0;

    // expected_auth set: the wire form must carry exactly that token.
    // expected_auth empty: the whole content is the message, no auth interpretation.
    [[nodiscard]] virtual DecodeResult decode(std::string_view wire,
                                              const std::optional<std::string>& expected_auth) const = 0;
};

// Direct transport: optional "AUTH:<token>\n" line, then "<message>\n".
class LineEnvelopeCodec final : public EnvelopeCodec {
public:
    std::string encode(const Envelope& envelope) const override;
    DecodeResult decode(std::string_view wire,
                        const std::optional<std::string>& expected_auth) const override;

    // Reads at most two lines. On an auth mismatch the message line is never pulled.
    DecodeResult decode(const LineSource& next_line,
                        const std::optional<std::string>& expected_auth) const;
};

// Relay transport: one payload, "AUTH:<token>:<message>" or "<message>".
class PayloadEnvelopeCodec final : public EnvelopeCodec {
public:
    std::string encode(const Envelope& envelope) const override;
    DecodeResult decode(std::string_view wire,
                        const std::optional<std::string>& expected_auth) const override;
};

[[nodiscard]] inline bool is_envelope(const DecodeResult& result) noexcept {
    return std::holds_alternative<Envelope>(result);
}

}  // namespace crier::protocol
