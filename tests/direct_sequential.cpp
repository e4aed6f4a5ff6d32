#include "crier/Config.hpp"
#include "crier/network/DirectTransport.hpp"
#include "crier/network/Socket.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

namespace {

struct Execution {
    std::string command;
    Clock::time_point started;
    Clock::time_point finished;
};

// Each dispatched command takes two seconds.
class SlowRunner final : public crier::dispatch::CommandRunner {
public:
    crier::dispatch::ExecutionOutcome run(const std::string& command) override {
        Execution execution{command, Clock::now(), {}};
        std::this_thread::sleep_for(2s);
        execution.finished = Clock::now();
        std::scoped_lock lock(mutex_);
        executions_.push_back(execution);
        return crier::dispatch::ExecutionOutcome::completed(0);
    }

    std::vector<Execution> executions() const {
        std::scoped_lock lock(mutex_);
        return executions_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Execution> executions_;
};

struct Delivery {
    std::optional<std::string> reply;
    Clock::time_point acknowledged;
};

Delivery deliver(std::uint16_t port, const std::string& message) {
    auto socket = crier::network::open_connection(crier::network::Endpoint{"127.0.0.1", port});
    if (!socket) {
        throw std::runtime_error(crier::network::format_socket_error("connect failed"));
    }
    if (!crier::network::send_text(socket.get(), message + "\n")) {
        throw std::runtime_error("send failed");
    }
    crier::network::LineReader reader(socket.get(), 1024);
    Delivery delivery{};
    delivery.reply = reader.read_line();
    delivery.acknowledged = Clock::now();
    return delivery;
}

}  // namespace

int main() {
    try {
        crier::Config config{};
        config.stop_poll_interval = 50ms;

        SlowRunner runner;
        crier::dispatch::Dispatcher dispatcher("sleep-then {}", runner);
        crier::network::DirectTransport listener(config, crier::network::Endpoint{"127.0.0.1", 0});
        const auto bound = listener.bind();
        assert(bound.ok());
        const auto port = *listener.bound_port();

        crier::StopSignal stop;
        crier::Outcome listen_outcome{};
        std::thread listen_thread([&]() { listen_outcome = listener.listen(std::nullopt, dispatcher, stop); });

        // Both peers connect at once; the second waits in the backlog.
        Delivery first{};
        Delivery second{};
        std::thread first_peer([&]() { first = deliver(port, "first"); });
        std::this_thread::sleep_for(100ms);
        std::thread second_peer([&]() { second = deliver(port, "second"); });
        first_peer.join();
        second_peer.join();

        stop.request_stop();
        listen_thread.join();
        assert(listen_outcome.ok());

        assert(first.reply == std::string{"OK"});
        assert(second.reply == std::string{"OK"});
        assert(second.acknowledged - first.acknowledged >= 1900ms);

        const auto executions = runner.executions();
        assert(executions.size() == 2);
        assert(executions[0].command == "sleep-then first");
        assert(executions[1].command == "sleep-then second");
        assert(executions[1].started >= executions[0].finished);
    } catch (const std::exception& ex) {
        std::cerr << "direct_sequential failed: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
