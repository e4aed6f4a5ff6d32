#include "crier/network/DirectTransport.hpp"

#include "crier/log/StructuredLogger.hpp"

#include <utility>
#include <variant>

#ifndef _WIN32
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace crier::network {

namespace {

using log::StructuredLogger;

std::string trim_trailing_whitespace(std::string value) {
    while (!value.empty() &&
           (value.back() == ' ' || value.back() == '\t' || value.back() == '\r' || value.back() == '\n')) {
        value.pop_back();
    }
    return value;
}

std::string terminated(std::string_view line) {
    std::string text(line);
    text.push_back('\n');
    return text;
}

}  // namespace

DirectTransport::DirectTransport(const Config& config, Endpoint endpoint)
    : config_(config), endpoint_(std::move(endpoint)) {}

Outcome DirectTransport::bind() {
    if (listen_socket_) {
        return Outcome::success();
    }
    auto socket = open_listener(endpoint_, SOMAXCONN);
    if (!socket) {
        const auto detail = format_socket_error("Failed to bind " + describe_endpoint(endpoint_));
        log::log_event(StructuredLogger::Level::Error, "direct.listen.bind_failed", {{"detail", detail}});
        return Outcome::failed(FailureKind::ConnectError, detail);
    }
    listen_socket_ = std::move(socket);

    const auto port = bound_port();
    log::log_event(StructuredLogger::Level::Info,
                   "direct.listen.bound",
                   {{"host", endpoint_.host}, {"port", port ? std::to_string(*port) : std::string{"?"}}});
    return Outcome::success();
}

std::optional<std::uint16_t> DirectTransport::bound_port() const {
    if (!listen_socket_) {
        return std::nullopt;
    }
    return local_port(listen_socket_.get());
}

Outcome DirectTransport::listen(const std::optional<std::string>& expected_auth,
                                dispatch::Dispatcher& dispatcher,
                                const StopSignal& stop) {
    if (auto bound = bind(); !bound.ok()) {
        return bound;
    }

    // Strictly sequential: a slow command holds later peers in the accept backlog.
    while (!stop.stop_requested()) {
        if (!wait_readable(listen_socket_.get(), config_.stop_poll_interval)) {
            continue;
        }

        auto client = accept_connection(listen_socket_.get());
        if (!client) {
            log::log_event(StructuredLogger::Level::Warning,
                           "direct.accept.failed",
                           {{"detail", format_socket_error("accept failed")}});
            continue;
        }
        handle_connection(std::move(client), expected_auth, dispatcher);
    }

    log::log_event(StructuredLogger::Level::Info, "direct.listen.stopped");
    listen_socket_.reset();
    return Outcome::success("listener stopped");
}

void DirectTransport::handle_connection(ScopedSocket client,
                                        const std::optional<std::string>& expected_auth,
                                        dispatch::Dispatcher& dispatcher) {
    const auto peer = peer_endpoint(client.get());
    LineReader reader(client.get(), config_.max_line_length);
    const auto result = codec_.decode([&reader]() { return reader.read_line(); }, expected_auth);

    if (reader.overflowed()) {
        log::log_event(StructuredLogger::Level::Warning,
                       "direct.message.dropped",
                       {{"peer", peer}, {"reason", "line exceeds limit"}});
        return;
    }

    if (const auto* error = std::get_if<protocol::DecodeError>(&result)) {
        if (*error == protocol::DecodeError::Auth) {
            log::log_event(StructuredLogger::Level::Warning, "direct.auth.rejected", {{"peer", peer}});
            if (!send_text(client.get(), terminated(protocol::kAuthRejectedLine))) {
                log::log_event(StructuredLogger::Level::Debug,
                               "direct.reply.failed",
                               {{"peer", peer}, {"detail", format_socket_error("send failed")}});
            }
            return;
        }
        log::log_event(StructuredLogger::Level::Debug,
                       "direct.message.dropped",
                       {{"peer", peer}, {"reason", "no message line"}});
        return;
    }

    const auto& envelope = std::get<Envelope>(result);
    log::log_event(StructuredLogger::Level::Info,
                   "direct.message.received",
                   {{"peer", peer}, {"message", envelope.message}});

    // The acknowledgment means "received and dispatch attempted", whatever the command did.
    dispatcher.dispatch(envelope.message);

    if (!send_text(client.get(), terminated(protocol::kAckLine))) {
        log::log_event(StructuredLogger::Level::Warning,
                       "direct.reply.failed",
                       {{"peer", peer}, {"detail", format_socket_error("send failed")}});
    }
}

Outcome DirectTransport::send(const Envelope& envelope) {
    const auto target = describe_endpoint(endpoint_);
    auto socket = open_connection(endpoint_);
    if (!socket) {
        return Outcome::failed(FailureKind::ConnectError, format_socket_error("Failed to connect to " + target));
    }

    if (!send_text(socket.get(), codec_.encode(envelope))) {
        return Outcome::failed(FailureKind::ConnectError,
                               format_socket_error("Connection to " + target + " lost while sending"));
    }
    log::log_event(StructuredLogger::Level::Debug, "direct.send.written", {{"target", target}});

    LineReader reader(socket.get(), config_.max_line_length);
    const auto line = reader.read_line();
    if (!line) {
        return Outcome::failed(FailureKind::ProtocolError, "No acknowledgment received from " + target);
    }

    const auto response = trim_trailing_whitespace(*line);
    if (response == protocol::kAckLine) {
        return Outcome::success(target);
    }
    if (response == protocol::kAuthRejectedLine) {
        return Outcome::failed(FailureKind::AuthError, response);
    }
    return Outcome::failed(FailureKind::ProtocolError, response);
}

}  // namespace crier::network
