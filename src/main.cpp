#include "crier/Config.hpp"
#include "crier/Types.hpp"
#include "crier/config/ConfigFile.hpp"
#include "crier/core/Orchestrator.hpp"
#include "crier/dispatch/Dispatcher.hpp"
#include "crier/log/StructuredLogger.hpp"

#include <charconv>
#include <csignal>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#ifndef _WIN32
#include <signal.h>
#endif

#ifndef CRIER_VERSION
#define CRIER_VERSION "v0.1.0"
#endif

namespace {

using crier::log::StructuredLogger;

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override { return formatted_.c_str(); }

    const std::string& code() const& { return code_; }
    const std::string& message() const& { return message_; }
    const std::string& hint() const& { return hint_; }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

crier::StopSignal g_stop;

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
#ifdef SIGBREAK
    case SIGBREAK:
#endif
        g_stop.request_stop();
        break;
    default:
        break;
    }
}

void install_termination_handlers() {
#ifdef _WIN32
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef SIGBREAK
    std::signal(SIGBREAK, signal_handler);
#endif
#else
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
#endif
}

void uninstall_termination_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#ifdef SIGBREAK
    std::signal(SIGBREAK, SIG_DFL);
#endif
}

void print_usage() {
    std::cout << "crier " << CRIER_VERSION << " - push a one-line message and run a command on receipt\n\n";
    std::cout << "Usage:\n";
    std::cout << "  crier --listen [ADDR] -m TEMPLATE [-a TOKEN] [--mqtt HOST[:PORT] --topic T]\n";
    std::cout << "  crier --send [ADDR] -m MESSAGE [-a TOKEN] [--mqtt HOST[:PORT] --topic T]\n";
    std::cout << "  crier -p PRESET [overrides]\n\n";
    std::cout << "Modes:\n";
    std::cout << "  --listen [ADDR]         Wait for messages. ADDR is the bind address (e.g. 0.0.0.0:5555)\n";
    std::cout << "  --send [ADDR]           Deliver one message. ADDR is the listener address\n\n";
    std::cout << "Message:\n";
    std::cout << "  -m, --message TEXT      Listen: command template, {} is replaced by the message\n";
    std::cout << "                          Send: the message to deliver\n";
    std::cout << "  -a, --auth TOKEN        Shared token; both sides must agree\n\n";
    std::cout << "Relay transport:\n";
    std::cout << "  --mqtt HOST[:PORT]      Use an MQTT broker instead of a direct connection\n";
    std::cout << "  --port N                Broker port (default 1883)\n";
    std::cout << "  --topic T               Topic to subscribe or publish to\n\n";
    std::cout << "Configuration:\n";
    std::cout << "  --config FILE           YAML or JSON configuration file\n";
    std::cout << "  -p, --preset NAME       Start from a preset in the configuration file\n";
    std::cout << "  --list-presets          Print the presets of the configuration file\n";
    std::cout << "  --shell PATH            Interpreter used to run the command template\n";
    std::cout << "  --log-format FORMAT     text (default) or json\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Only log errors\n";
    std::cout << "  --examples              Show usage examples\n";
    std::cout << "  --version               Print the version\n";
    std::cout << "  -h, --help              Show this help" << std::endl;
}

void print_examples() {
    std::cout << "Direct (TCP):\n";
    std::cout << "  crier --listen 0.0.0.0:5555 -m 'notify-send \"Alert\" \"{}\"'\n";
    std::cout << "  crier --send 192.168.1.10:5555 -m 'Build done!'\n\n";
    std::cout << "With a shared token:\n";
    std::cout << "  crier --listen 0.0.0.0:5555 -m 'echo {} >> ~/alerts.log' -a secret\n";
    std::cout << "  crier --send 192.168.1.10:5555 -m 'deploy finished' -a secret\n\n";
    std::cout << "Relay (MQTT broker):\n";
    std::cout << "  crier --listen --mqtt broker.local --topic crier/alerts -m 'notify-send \"{}\"'\n";
    std::cout << "  crier --send --mqtt broker.local:1883 --topic crier/alerts -m 'Build done!'\n\n";
    std::cout << "Presets (~/.config/crier/config.yaml):\n";
    std::cout << "  crier --list-presets\n";
    std::cout << "  crier -p desk\n";
    std::cout << "  crier -p ci -m 'nightly build green'" << std::endl;
}

struct CliOptions {
    crier::config::OperationRequest request;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> preset;
    std::optional<std::string> shell;
    std::optional<StructuredLogger::Format> log_format;
    bool list_presets{false};
    bool examples{false};
    bool verbose{false};
    bool quiet{false};
};

std::uint16_t parse_port(std::string_view text, std::string_view option) {
    unsigned int value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || value == 0 || value > 65535) {
        throw_cli_error("E_INVALID_PORT",
                        "Invalid port '" + std::string(text) + "' for " + std::string(option),
                        "Use a number between 1 and 65535");
    }
    return static_cast<std::uint16_t>(value);
}

// HOST, HOST:PORT, [V6] or [V6]:PORT.
void set_mqtt_broker(crier::config::OperationRequest& request, std::string_view value) {
    std::string_view host = value;
    std::string_view port_text;
    bool has_port = false;
    if (!value.empty() && value.front() == '[') {
        const auto close = value.find(']');
        if (close == std::string_view::npos || (close + 1 < value.size() && value[close + 1] != ':')) {
            throw_cli_error("E_INVALID_BROKER", "Malformed broker '" + std::string(value) + "'",
                            "Example: --mqtt [::1]:1883");
        }
        host = value.substr(1, close - 1);
        has_port = close + 1 < value.size();
        if (has_port) {
            port_text = value.substr(close + 2);
        }
    } else if (const auto colon = value.rfind(':'); colon != std::string_view::npos) {
        host = value.substr(0, colon);
        port_text = value.substr(colon + 1);
        has_port = true;
    }
    if (has_port) {
        request.port = parse_port(port_text, "--mqtt");
    }
    if (host.empty()) {
        throw_cli_error("E_INVALID_BROKER", "--mqtt requires a broker host", "Example: --mqtt broker.local:1883");
    }
    request.broker = std::string(host);
}

// Returns nullopt when the invocation was fully handled (help, version).
std::optional<CliOptions> parse_arguments(const std::vector<std::string_view>& args) {
    CliOptions options{};
    auto& request = options.request;
    std::size_t index = 0;

    auto require_value = [&](std::string_view option) -> std::string {
        if (index >= args.size()) {
            throw_cli_error("E_MISSING_VALUE",
                            std::string(option) + " requires a value",
                            "Provide an argument immediately after " + std::string(option));
        }
        return std::string(args[index++]);
    };

    auto set_once = [](auto& slot, auto value, std::string_view option) {
        if (slot.has_value()) {
            throw_cli_error("E_DUPLICATE_OPTION",
                            "Option " + std::string(option) + " specified multiple times",
                            "Provide it only once");
        }
        slot = std::move(value);
    };

    auto select_mode = [&](crier::Role role) {
        if (request.role.has_value()) {
            throw_cli_error("E_MODE_CONFLICT",
                            "Only one of --listen or --send may be given",
                            "Run one crier process per role");
        }
        request.role = role;
        if (index < args.size() && !args[index].starts_with("-")) {
            request.direct_address = std::string(args[index++]);
        }
    };

    while (index < args.size()) {
        const auto opt = args[index++];
        if (opt == "--help" || opt == "-h") {
            print_usage();
            return std::nullopt;
        }
        if (opt == "--version") {
            std::cout << "crier " << CRIER_VERSION << std::endl;
            return std::nullopt;
        }
        if (opt == "--listen") {
            select_mode(crier::Role::Listener);
        } else if (opt == "--send") {
            select_mode(crier::Role::Sender);
        } else if (opt == "-m" || opt == "--message") {
            set_once(request.message, require_value(opt), opt);
        } else if (opt == "-a" || opt == "--auth") {
            set_once(request.auth, require_value(opt), opt);
        } else if (opt == "--mqtt") {
            if (request.broker.has_value()) {
                throw_cli_error("E_DUPLICATE_OPTION", "Option --mqtt specified multiple times", "Provide it only once");
            }
            set_mqtt_broker(request, require_value(opt));
        } else if (opt == "--port") {
            request.port = parse_port(require_value(opt), opt);
        } else if (opt == "--topic") {
            set_once(request.topic, require_value(opt), opt);
        } else if (opt == "--config") {
            set_once(options.config_path, std::filesystem::path(require_value(opt)), opt);
        } else if (opt == "-p" || opt == "--preset") {
            set_once(options.preset, require_value(opt), opt);
        } else if (opt == "--list-presets") {
            options.list_presets = true;
        } else if (opt == "--examples") {
            options.examples = true;
        } else if (opt == "--shell") {
            set_once(options.shell, require_value(opt), opt);
        } else if (opt == "--log-format") {
            const auto value = require_value(opt);
            const auto format = StructuredLogger::parse_format(value);
            if (!format) {
                throw_cli_error("E_INVALID_LOG_FORMAT", "Unknown log format '" + value + "'", "Use 'text' or 'json'");
            }
            options.log_format = format;
        } else if (opt == "-v" || opt == "--verbose") {
            options.verbose = true;
        } else if (opt == "-q" || opt == "--quiet") {
            options.quiet = true;
        } else {
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown argument: " + std::string(opt),
                            "Run 'crier --help' to see the available options");
        }
    }

    if (options.verbose && options.quiet) {
        throw_cli_error("E_OPTION_CONFLICT", "--verbose and --quiet cannot be combined");
    }
    return options;
}

std::string describe_listener(const crier::Operation& operation) {
    if (const auto* direct = std::get_if<crier::DirectTarget>(&operation.transport)) {
        return direct->address;
    }
    const auto& relay = std::get<crier::RelayTarget>(operation.transport);
    return "mqtt://" + relay.broker + ":" + std::to_string(relay.port) + " (topic " + relay.topic + ")";
}

void report_failure(const crier::Outcome& outcome) {
    std::cerr << "Error [" << crier::to_string(outcome.failure) << "]: " << outcome.detail << std::endl;
}

int run(const CliOptions& options) {
    auto& logger = StructuredLogger::instance();

    crier::Config config{};
    crier::config::LogSettings log_settings{};
    std::optional<crier::config::Value> document;

    const auto config_path = options.config_path ? options.config_path : crier::config::default_config_path();
    if (config_path) {
        document = crier::config::load_document(*config_path);
        crier::config::apply_settings(*document, config, log_settings);
    }

    if (log_settings.format) {
        logger.set_format(*log_settings.format);
    }
    if (log_settings.level) {
        logger.set_min_level(*log_settings.level);
    }
    if (options.log_format) {
        logger.set_format(*options.log_format);
    }
    if (options.verbose) {
        logger.set_min_level(StructuredLogger::Level::Debug);
    } else if (options.quiet) {
        logger.set_min_level(StructuredLogger::Level::Error);
    }
    if (options.shell) {
        config.shell = options.shell;
    }

    if (options.examples) {
        print_examples();
        return 0;
    }

    if (options.list_presets) {
        if (!document) {
            throw_cli_error("E_CONFIG_REQUIRED",
                            "No configuration file found",
                            "Pass --config FILE or create ~/.config/crier/config.yaml");
        }
        const auto names = crier::config::preset_names(*document);
        if (names.empty()) {
            std::cout << "No presets defined in " << config_path->string() << std::endl;
        }
        for (const auto& name : names) {
            std::cout << name << std::endl;
        }
        return 0;
    }

    crier::config::OperationRequest request = options.request;
    if (options.preset) {
        if (!document) {
            throw_cli_error("E_CONFIG_REQUIRED",
                            "Preset '" + *options.preset + "' requested but no configuration file was found",
                            "Pass --config FILE or set CRIER_CONFIG");
        }
        const auto preset = crier::config::resolve_preset(*document, *options.preset);
        request = crier::config::merge(crier::config::request_from_preset(preset, *options.preset), options.request);
    }

    const auto operation = crier::config::build_operation(request);
    if (const auto invalid = crier::core::validate(operation)) {
        report_failure(*invalid);
        return 1;
    }

    crier::dispatch::ShellCommandRunner runner =
        config.shell ? crier::dispatch::ShellCommandRunner(
                           crier::dispatch::ShellSpec{*config.shell, crier::dispatch::default_shell().command_flag})
                     : crier::dispatch::ShellCommandRunner();

    if (operation.role == crier::Role::Listener) {
        std::cout << "Listening on " << describe_listener(operation) << std::endl;
        std::cout << "Command: " << operation.payload_or_template << std::endl;
        if (operation.auth) {
            std::cout << "Auth: enabled" << std::endl;
        }
        install_termination_handlers();
        const auto outcome = crier::core::run_operation(operation, config, runner, g_stop);
        uninstall_termination_handlers();
        if (!outcome.ok()) {
            report_failure(outcome);
            return 1;
        }
        return 0;
    }

    const auto outcome = crier::core::run_operation(operation, config, runner, g_stop);
    if (!outcome.ok()) {
        report_failure(outcome);
        return 1;
    }
    std::cout << "Sent: " << operation.payload_or_template << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }
        if (args.empty()) {
            print_usage();
            return 1;
        }

        const auto options = parse_arguments(args);
        if (!options) {
            return 0;
        }
        return run(*options);
    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 1;
    } catch (const crier::config::ConfigError& ex) {
        print_cli_error(CliException(ex.code, ex.message, ex.hint));
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
