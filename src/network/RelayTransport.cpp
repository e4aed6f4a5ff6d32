#include "crier/network/RelayTransport.hpp"

#include "crier/log/StructuredLogger.hpp"

#include <algorithm>
#include <thread>
#include <utility>
#include <variant>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace crier::network {

namespace mqtt = protocol::mqtt;

namespace {

using log::StructuredLogger;

long current_process_id() {
#ifdef _WIN32
    return static_cast<long>(::_getpid());
#else
    return static_cast<long>(::getpid());
#endif
}

std::string describe_broker(const RelayTarget& target) {
    return target.broker + ":" + std::to_string(target.port);
}

}  // namespace

Outcome RelayTransport::topic_too_long() const {
    return Outcome::failed(FailureKind::ConfigError,
                           "Topic of " + std::to_string(target_.topic.size()) + " bytes exceeds the MQTT limit of 65535");
}

bool has_topic_wildcard(std::string_view topic) noexcept {
    return topic.find_first_of("+#") != std::string_view::npos;
}

RelayTransport::RelayTransport(const Config& config, RelayTarget target)
    : config_(config), target_(std::move(target)) {}

std::string RelayTransport::client_id(Role role) const {
    return config_.client_id_prefix + "-" + std::string(to_string(role)) + "-" +
           std::to_string(current_process_id());
}

BrokerSession::Settings RelayTransport::session_settings(Role role) const {
    BrokerSession::Settings settings{};
    settings.broker = Endpoint{target_.broker, target_.port};
    settings.client_id = client_id(role);
    settings.keep_alive = config_.relay_keep_alive;
    return settings;
}

Outcome RelayTransport::listen(const std::optional<std::string>& expected_auth,
                               dispatch::Dispatcher& dispatcher,
                               const StopSignal& stop) {
    if (target_.topic.size() > mqtt::kMaxStringLength) {
        return topic_too_long();
    }
    BrokerSession session(session_settings(Role::Listener));
    if (auto opened = session.open(); !opened.ok()) {
        log::log_event(StructuredLogger::Level::Error, "relay.listen.connect_failed", {{"detail", opened.detail}});
        return opened;
    }
    session.subscribe(target_.topic, mqtt::QoS::AtLeastOnce);

    bool established = false;
    while (!stop.stop_requested()) {
        auto event = session.next_event(config_.stop_poll_interval);
        if (!event) {
            continue;
        }

        if (std::holds_alternative<ConnAckEvent>(*event)) {
            established = true;
            log::log_event(StructuredLogger::Level::Info,
                           "relay.listen.connected",
                           {{"broker", describe_broker(target_)}, {"client_id", session.client_id()}});
        } else if (const auto* suback = std::get_if<SubAckEvent>(&*event)) {
            const auto rejected = std::any_of(suback->return_codes.begin(), suback->return_codes.end(),
                                              [](std::uint8_t code) { return code == mqtt::kSubAckFailure; });
            if (rejected) {
                session.disconnect();
                return Outcome::failed(FailureKind::ConnectError,
                                       "Broker rejected subscription to '" + target_.topic + "'");
            }
            log::log_event(StructuredLogger::Level::Info, "relay.listen.subscribed", {{"topic", target_.topic}});
        } else if (const auto* publish = std::get_if<IncomingPublish>(&*event)) {
            handle_publish(*publish, expected_auth, dispatcher);
        } else if (const auto* lost = std::get_if<ConnectionLost>(&*event)) {
            if (!established) {
                return Outcome::failed(FailureKind::ConnectError, lost->detail);
            }
            if (!reconnect(session, stop)) {
                break;
            }
        }
    }

    session.disconnect();
    log::log_event(StructuredLogger::Level::Info, "relay.listen.stopped", {{"topic", target_.topic}});
    return Outcome::success("listener stopped");
}

void RelayTransport::handle_publish(const IncomingPublish& publish,
                                    const std::optional<std::string>& expected_auth,
                                    dispatch::Dispatcher& dispatcher) {
    const auto result = codec_.decode(publish.payload, expected_auth);
    if (!protocol::is_envelope(result)) {
        log::log_event(StructuredLogger::Level::Warning,
                       "relay.auth.rejected",
                       {{"topic", publish.topic},
                        {"reason", std::string(protocol::to_string(std::get<protocol::DecodeError>(result)))}});
        return;
    }

    const auto& envelope = std::get<Envelope>(result);
    log::log_event(StructuredLogger::Level::Info,
                   "relay.message.received",
                   {{"topic", publish.topic}, {"message", envelope.message}});
    dispatcher.dispatch(envelope.message);
}

bool RelayTransport::reconnect(BrokerSession& session, const StopSignal& stop) {
    while (pause(config_.relay_reconnect_delay, stop)) {
        log::log_event(StructuredLogger::Level::Info,
                       "relay.listen.reconnecting",
                       {{"broker", describe_broker(target_)}});
        const auto opened = session.open();
        if (opened.ok()) {
            session.subscribe(target_.topic, mqtt::QoS::AtLeastOnce);
            return true;
        }
        log::log_event(StructuredLogger::Level::Warning, "relay.listen.reconnect_failed", {{"detail", opened.detail}});
    }
    return false;
}

bool RelayTransport::pause(std::chrono::milliseconds duration, const StopSignal& stop) const {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop.stop_requested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, config_.stop_poll_interval));
    }
    return false;
}

Outcome RelayTransport::send(const Envelope& envelope) {
    if (has_topic_wildcard(target_.topic)) {
        return Outcome::failed(FailureKind::ConfigError,
                               "Cannot publish to wildcard topic '" + target_.topic + "'");
    }
    if (target_.topic.size() > mqtt::kMaxStringLength) {
        return topic_too_long();
    }
    auto payload = codec_.encode(envelope);
    if (!mqtt::publish_fits(target_.topic, payload.size(), mqtt::QoS::AtMostOnce)) {
        return Outcome::failed(FailureKind::ConfigError,
                               "Message of " + std::to_string(payload.size()) + " bytes does not fit in one MQTT packet");
    }

    BrokerSession session(session_settings(Role::Sender));
    if (auto opened = session.open(); !opened.ok()) {
        return opened;
    }

    const auto sequence = session.publish(target_.topic, std::move(payload), mqtt::QoS::AtMostOnce);
    const auto deadline = std::chrono::steady_clock::now() + config_.relay_confirm_timeout;

    // Pump the event stream until our own publish has left the client.
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto event =
            session.next_event(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        if (!event) {
            continue;
        }
        if (const auto* sent = std::get_if<OutgoingPublish>(&*event); sent && sent->sequence == sequence) {
            log::log_event(StructuredLogger::Level::Debug,
                           "relay.publish.confirmed",
                           {{"topic", target_.topic}, {"broker", describe_broker(target_)}});
            session.disconnect();
            return Outcome::success(describe_broker(target_));
        }
        if (const auto* lost = std::get_if<ConnectionLost>(&*event)) {
            return Outcome::failed(FailureKind::ConnectError, lost->detail);
        }
    }

    session.disconnect();
    log::log_event(StructuredLogger::Level::Error,
                   "relay.publish.timeout",
                   {{"topic", target_.topic}, {"timeout_ms", std::to_string(config_.relay_confirm_timeout.count())}});
    return Outcome::failed(FailureKind::TimeoutError,
                           "Publish to '" + target_.topic + "' not confirmed within " +
                               std::to_string(config_.relay_confirm_timeout.count()) + " ms");
}

}  // namespace crier::network
