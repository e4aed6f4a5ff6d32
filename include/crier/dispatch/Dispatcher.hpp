#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace crier::dispatch {

inline constexpr std::string_view kPlaceholder{"{}"};

struct ExecutionOutcome {
    enum class Status {
        Completed,
        LaunchFailed
    };

    Status status{Status::Completed};
    bool success{false};
    // Exit code when the interpreter exited normally; -1 when killed by a signal.
    int exit_code{-1};
    std::string reason;

    static ExecutionOutcome completed(int exit_code, std::string reason = {});
    static ExecutionOutcome launch_failed(std::string reason);
};

// Replaces every "{}" in command_template with message, verbatim.
std::string render_command(std::string_view command_template, std::string_view message);

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs synchronously; the child inherits stdout/stderr.
    virtual ExecutionOutcome run(const std::string& command) = 0;
};

struct ShellSpec {
    std::string program;
    std::string command_flag;
};

ShellSpec default_shell();

class ShellCommandRunner final : public CommandRunner {
public:
    ShellCommandRunner();
    explicit ShellCommandRunner(ShellSpec shell);

    ExecutionOutcome run(const std::string& command) override;

    [[nodiscard]] const ShellSpec& shell() const noexcept { return shell_; }

private:
    ShellSpec shell_;
};

class Dispatcher {
public:
    Dispatcher(std::string command_template, CommandRunner& runner);

    ExecutionOutcome dispatch(const std::string& message);

    [[nodiscard]] const std::string& command_template() const noexcept { return template_; }

private:
    std::string template_;
    CommandRunner& runner_;
};

}  // namespace crier::dispatch
