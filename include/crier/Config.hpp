#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace crier {

struct Config {
    std::chrono::milliseconds relay_confirm_timeout{std::chrono::seconds(5)};
    std::chrono::seconds relay_keep_alive{std::chrono::seconds(30)};
    std::chrono::milliseconds relay_reconnect_delay{std::chrono::seconds(1)};
    std::chrono::milliseconds stop_poll_interval{std::chrono::milliseconds(200)};
    std::string client_id_prefix{"crier"};
    std::size_t max_line_length{64 * 1024};
    std::optional<std::string> shell{};
};

}  // namespace crier
