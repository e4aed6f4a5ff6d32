#include "test_broker.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
#if defined(_WIN32)
    FILE* pipe = _popen(command.c_str(), "r");
#else
    FILE* pipe = popen(command.c_str(), "r");
#endif
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

#if defined(_WIN32)
    const int exit_code = _pclose(pipe);
#else
    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
#endif

    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool check(const CommandResult& result, int expected_exit, const std::string& needle, const std::string& label) {
    if (result.exit_code == expected_exit && expect_contains(result.output, needle)) {
        return true;
    }
    std::cerr << "Failure on " << label << ". exit=" << result.exit_code << "\n" << result.output << std::endl;
    return false;
}

void set_env(const char* name, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(name, value.c_str());
#else
    ::setenv(name, value.c_str(), 1);
#endif
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("CRIER_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "CRIER_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }

    const std::string executable = std::filesystem::path(executable_env).string();

    // Keep a config file in the user's home directory out of the picture.
    const auto dir = std::filesystem::temp_directory_path() / "crier_cli_error_cases";
    std::filesystem::create_directories(dir);
    const auto empty_config = dir / "empty.yaml";
    const auto preset_config = dir / "presets.yaml";
    {
        std::ofstream out(empty_config, std::ios::trunc);
        out << "# no settings\n";
    }
    {
        std::ofstream out(preset_config, std::ios::trunc);
        out << "presets:\n  local:\n    send: 127.0.0.1:1\n    message: hello\n  loop:\n    extends: loop\n";
    }
    set_env("CRIER_CONFIG", empty_config.string());

    bool ok = true;
    try {
        ok &= check(run_cli(executable, "--help"), 0, "Usage:", "--help");
        ok &= check(run_cli(executable, "--version"), 0, "crier v", "--version");
        ok &= check(run_cli(executable, ""), 1, "Usage:", "no arguments");
        ok &= check(run_cli(executable, "--examples"), 0, "--listen", "--examples");

        ok &= check(run_cli(executable, "--listen --send 127.0.0.1:9000 -m hi"), 1, "E_MODE_CONFLICT",
                    "--listen with --send");
        ok &= check(run_cli(executable, "--send 127.0.0.1:9000 --bogus"), 1, "E_UNKNOWN_OPTION", "unknown option");
        ok &= check(run_cli(executable, "--send 127.0.0.1:9000 -m"), 1, "E_MISSING_VALUE", "-m without a value");
        ok &= check(run_cli(executable, "--send -m hi -m again"), 1, "E_DUPLICATE_OPTION", "duplicate -m");
        ok &= check(run_cli(executable, "--send --mqtt broker.local:0 --topic t -m hi"), 1, "E_INVALID_PORT",
                    "--mqtt port 0");
        ok &= check(run_cli(executable, "--send 127.0.0.1:9000 -m hi --log-format xml"), 1,
                    "E_INVALID_LOG_FORMAT", "--log-format xml");
        ok &= check(run_cli(executable, "--send 127.0.0.1:9000 -m hi -v -q"), 1, "E_OPTION_CONFLICT",
                    "--verbose with --quiet");
        ok &= check(run_cli(executable, "-m hi"), 1, "E_MODE_REQUIRED", "no mode");
        ok &= check(run_cli(executable, "--send 127.0.0.1:9000 --mqtt broker.local --topic t -m hi"), 1,
                    "E_TRANSPORT_CONFLICT", "address with --mqtt");

        // Configuration errors surface before any connection attempt.
        ok &= check(run_cli(executable, "--send -m hi"), 1, "Error [ConfigError]", "--send without address");
        ok &= check(run_cli(executable, "--send 127.0.0.1:9000"), 1, "E_MESSAGE_REQUIRED", "--send without message");
        ok &= check(run_cli(executable, "--listen 127.0.0.1:9000"), 1, "E_MESSAGE_REQUIRED",
                    "--listen without template");
        ok &= check(run_cli(executable, "--send --mqtt broker.local -m hi"), 1, "Error [ConfigError]",
                    "--mqtt without topic");
        ok &= check(run_cli(executable, "--send --mqtt broker.local --topic \"a/#\" -m hi"), 1, "Error [ConfigError]",
                    "wildcard publish");

        ok &= check(run_cli(executable, "--send 127.0.0.1:1 -m hi"), 1, "Error [ConnectError]", "refused connection");
        // An empty message passes validation and reaches the network.
        ok &= check(run_cli(executable, "--send 127.0.0.1:1 -m \"\""), 1, "Error [ConnectError]", "empty message");
        ok &= check(run_cli(executable, "--send \"[::1]:1\" -m hi"), 1, "Error [ConnectError]", "IPv6 address");

        {
            // A broker that accepts the connection but never answers CONNECT.
            crier::test::TestBroker::Options options{};
            options.send_connack = false;
            crier::test::TestBroker broker(options);
            ok &= check(run_cli(executable, "--send --mqtt 127.0.0.1:" + std::to_string(broker.port()) +
                                                " --topic crier/silent -m hi"),
                        1, "Error [TimeoutError]", "relay send without CONNACK");
        }

        ok &= check(run_cli(executable, "--config \"" + (dir / "absent.yaml").string() + "\" --list-presets"), 1,
                    "E_CONFIG_NOT_FOUND", "missing --config file");
        ok &= check(run_cli(executable, "--config \"" + preset_config.string() + "\" --list-presets"), 0, "local",
                    "--list-presets");
        ok &= check(run_cli(executable, "--config \"" + preset_config.string() + "\" -p missing"), 1,
                    "E_CONFIG_PRESET", "unknown preset");
        ok &= check(run_cli(executable, "--config \"" + preset_config.string() + "\" -p loop"), 1,
                    "E_CONFIG_PRESET", "preset cycle");
        ok &= check(run_cli(executable, "--config \"" + preset_config.string() + "\" -p local"), 1,
                    "Error [ConnectError]", "preset send");
    } catch (const std::exception& ex) {
        std::cerr << "cli_error_cases failed: " << ex.what() << std::endl;
        ok = false;
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return ok ? 0 : 1;
}
