#include "crier/dispatch/Dispatcher.hpp"

#include "crier/log/StructuredLogger.hpp"

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <process.h>
#else
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

extern char** environ;
#endif

namespace crier::dispatch {

using log::StructuredLogger;

ExecutionOutcome ExecutionOutcome::completed(int exit_code, std::string reason) {
    ExecutionOutcome outcome{};
    outcome.status = Status::Completed;
    outcome.exit_code = exit_code;
    outcome.success = exit_code == 0;
    outcome.reason = std::move(reason);
    return outcome;
}

ExecutionOutcome ExecutionOutcome::launch_failed(std::string reason) {
    ExecutionOutcome outcome{};
    outcome.status = Status::LaunchFailed;
    outcome.success = false;
    outcome.reason = std::move(reason);
    return outcome;
}

std::string render_command(std::string_view command_template, std::string_view message) {
    std::string command;
    command.reserve(command_template.size() + message.size());
    std::size_t cursor = 0;
    while (true) {
        const auto pos = command_template.find(kPlaceholder, cursor);
        if (pos == std::string_view::npos) {
            command.append(command_template.substr(cursor));
            break;
        }
        command.append(command_template.substr(cursor, pos - cursor));
        command.append(message);
        cursor = pos + kPlaceholder.size();
    }
    return command;
}

ShellSpec default_shell() {
#ifdef _WIN32
    return ShellSpec{"cmd", "/C"};
#else
    return ShellSpec{"/bin/sh", "-c"};
#endif
}

ShellCommandRunner::ShellCommandRunner() : shell_(default_shell()) {}

ShellCommandRunner::ShellCommandRunner(ShellSpec shell) : shell_(std::move(shell)) {}

ExecutionOutcome ShellCommandRunner::run(const std::string& command) {
#ifdef _WIN32
    const auto status = ::_spawnlp(_P_WAIT,
                                   shell_.program.c_str(),
                                   shell_.program.c_str(),
                                   shell_.command_flag.c_str(),
                                   command.c_str(),
                                   nullptr);
    if (status == -1) {
        return ExecutionOutcome::launch_failed(std::strerror(errno));
    }
    return ExecutionOutcome::completed(static_cast<int>(status),
                                       status == 0 ? std::string{} : "exit status: " + std::to_string(status));
#else
    std::string program = shell_.program;
    std::string flag = shell_.command_flag;
    std::string text = command;
    std::vector<char*> argv{program.data(), flag.data(), text.data(), nullptr};

    pid_t pid = 0;
    const int spawn_error = ::posix_spawnp(&pid, program.c_str(), nullptr, nullptr, argv.data(), environ);
    if (spawn_error != 0) {
        return ExecutionOutcome::launch_failed(shell_.program + ": " + std::strerror(spawn_error));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return ExecutionOutcome::launch_failed(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        // posix_spawnp may report a failed exec as a child exiting with 127.
        return ExecutionOutcome::completed(code, code == 0 ? std::string{} : "exit status: " + std::to_string(code));
    }
    if (WIFSIGNALED(status)) {
        return ExecutionOutcome::completed(-1, "terminated by signal " + std::to_string(WTERMSIG(status)));
    }
    return ExecutionOutcome::completed(-1, "abnormal termination");
#endif
}

Dispatcher::Dispatcher(std::string command_template, CommandRunner& runner)
    : template_(std::move(command_template)), runner_(runner) {}

ExecutionOutcome Dispatcher::dispatch(const std::string& message) {
    const auto command = render_command(template_, message);
    log::log_event(StructuredLogger::Level::Info, "dispatch.command.running", {{"command", command}});

    auto outcome = runner_.run(command);
    if (outcome.status == ExecutionOutcome::Status::LaunchFailed) {
        log::log_event(StructuredLogger::Level::Error,
                       "dispatch.command.launch_failed",
                       {{"command", command}, {"reason", outcome.reason}});
    } else if (!outcome.success) {
        log::log_event(StructuredLogger::Level::Warning,
                       "dispatch.command.failed",
                       {{"command", command}, {"reason", outcome.reason}});
    } else {
        log::log_event(StructuredLogger::Level::Debug, "dispatch.command.completed", {{"command", command}});
    }
    return outcome;
}

}  // namespace crier::dispatch
