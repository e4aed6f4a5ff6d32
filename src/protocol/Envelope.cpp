#include "crier/protocol/Envelope.hpp"

#include <utility>

namespace crier::protocol {

namespace {

std::string auth_line(const std::string& token) {
    std::string line;
    line.reserve(kAuthPrefix.size() + token.size());
    line.append(kAuthPrefix);
    line.append(token);
    return line;
}

// Splits a buffered wire form into lines the same way a socket reader would:
// '\n' terminates, a trailing '\r' is dropped, an unterminated tail still counts.
class BufferedLines {
public:
    explicit BufferedLines(std::string_view wire) : wire_(wire) {}

    std::optional<std::string> next() {
        if (cursor_ >= wire_.size()) {
            return std::nullopt;
        }
        const auto end = wire_.find('\n', cursor_);
        std::string_view line = end == std::string_view::npos
                                    ? wire_.substr(cursor_)
                                    : wire_.substr(cursor_, end - cursor_);
        cursor_ = end == std::string_view::npos ? wire_.size() : end + 1;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        return std::string(line);
    }

private:
    std::string_view wire_;
    std::size_t cursor_{0};
};

}  // namespace

std::string_view to_string(DecodeError error) noexcept {
    switch (error) {
        case DecodeError::Auth:
            return "auth";
        case DecodeError::Format:
            return "format";
    }
    return "format";
}

std::string LineEnvelopeCodec::encode(const Envelope& envelope) const {
    std::string wire;
    if (envelope.auth) {
        wire.append(auth_line(*envelope.auth));
        wire.push_back('\n');
    }
    wire.append(envelope.message);
    wire.push_back('\n');
    return wire;
}

DecodeResult LineEnvelopeCodec::decode(std::string_view wire,
                                       const std::optional<std::string>& expected_auth) const {
    BufferedLines lines(wire);
    return decode([&lines]() { return lines.next(); }, expected_auth);
}

DecodeResult LineEnvelopeCodec::decode(const LineSource& next_line,
                                       const std::optional<std::string>& expected_auth) const {
    Envelope envelope{};
    if (expected_auth) {
        const auto first = next_line();
        if (!first || *first != auth_line(*expected_auth)) {
            return DecodeError::Auth;
        }
        envelope.auth = expected_auth;
    }

    auto message = next_line();
    if (!message) {
        return DecodeError::Format;
    }
    envelope.message = std::move(*message);
    return envelope;
}

std::string PayloadEnvelopeCodec::encode(const Envelope& envelope) const {
    if (!envelope.auth) {
        return envelope.message;
    }
    std::string payload = auth_line(*envelope.auth);
    payload.push_back(':');
    payload.append(envelope.message);
    return payload;
}

DecodeResult PayloadEnvelopeCodec::decode(std::string_view wire,
                                          const std::optional<std::string>& expected_auth) const {
    Envelope envelope{};
    if (!expected_auth) {
        envelope.message = std::string(wire);
        return envelope;
    }

    // Fixed-prefix match; a token containing ':' is compared as a whole.
    const auto prefix = auth_line(*expected_auth) + ":";
    if (!wire.starts_with(prefix)) {
        return DecodeError::Auth;
    }
    envelope.auth = expected_auth;
    envelope.message = std::string(wire.substr(prefix.size()));
    return envelope;
}

}  // namespace crier::protocol
