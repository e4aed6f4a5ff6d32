#include "crier/dispatch/Dispatcher.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using crier::dispatch::Dispatcher;
using crier::dispatch::ExecutionOutcome;
using crier::dispatch::ShellCommandRunner;
using crier::dispatch::render_command;

namespace {

class RecordingRunner final : public crier::dispatch::CommandRunner {
public:
    ExecutionOutcome run(const std::string& command) override {
        commands.push_back(command);
        return ExecutionOutcome::completed(0);
    }

    std::vector<std::string> commands;
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

int main() {
    assert(render_command("notify-send \"Alert\" \"{}\"", "Build done!") == "notify-send \"Alert\" \"Build done!\"");
    assert(render_command("echo {} {}", "hi") == "echo hi hi");
    assert(render_command("echo static", "ignored") == "echo static");
    assert(render_command("{}", "") == "");
    // Substituted text is never rescanned for placeholders.
    assert(render_command("echo {}", "{}") == "echo {}");
    // Verbatim substitution: quoting is the template author's responsibility.
    assert(render_command("echo {}", "a; b") == "echo a; b");

    {
        RecordingRunner runner;
        Dispatcher dispatcher("say {}", runner);
        const auto outcome = dispatcher.dispatch("ping");
        assert(outcome.status == ExecutionOutcome::Status::Completed);
        assert(outcome.success);
        assert((runner.commands == std::vector<std::string>{"say ping"}));
    }

#ifndef _WIN32
    {
        ShellCommandRunner runner;
        const auto ok = runner.run("exit 0");
        assert(ok.status == ExecutionOutcome::Status::Completed);
        assert(ok.success && ok.exit_code == 0);

        const auto failing = runner.run("exit 3");
        assert(failing.status == ExecutionOutcome::Status::Completed);
        assert(!failing.success);
        assert(failing.exit_code == 3);
    }

    {
        // A bare shell name is looked up on PATH.
        ShellCommandRunner runner(crier::dispatch::ShellSpec{"sh", "-c"});
        const auto outcome = runner.run("exit 0");
        assert(outcome.status == ExecutionOutcome::Status::Completed);
        assert(outcome.success);

        // An empty message against a bare "{}" template runs an empty command.
        Dispatcher dispatcher("{}", runner);
        assert(dispatcher.dispatch("").success);
    }

    {
        // The command runs to completion before dispatch returns.
        const auto marker = std::filesystem::temp_directory_path() /
                            ("crier_dispatch_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        ShellCommandRunner runner;
        Dispatcher dispatcher("printf '%s' '{}' > '" + marker.string() + "'", runner);
        const auto outcome = dispatcher.dispatch("hello world");
        assert(outcome.success);
        assert(read_file(marker) == "hello world");
        std::filesystem::remove(marker);
    }

    {
        ShellCommandRunner runner(crier::dispatch::ShellSpec{"/nonexistent/crier-shell", "-c"});
        const auto outcome = runner.run("true");
        assert(!outcome.success);
        // Some libcs report a failed exec as exit status 127 instead of a spawn error.
        assert(outcome.status == ExecutionOutcome::Status::LaunchFailed || outcome.exit_code == 127);
    }
#endif

    return 0;
}
