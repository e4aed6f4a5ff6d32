#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#endif

namespace crier::network {

#ifdef _WIN32
using NativeSocket = SOCKET;
inline const NativeSocket kInvalidSocket = INVALID_SOCKET;
#else
using NativeSocket = int;
inline constexpr NativeSocket kInvalidSocket = -1;
#endif

class ScopedSocket {
public:
    ScopedSocket() = default;
    explicit ScopedSocket(NativeSocket handle) : handle_(handle) {}
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;
    ScopedSocket(ScopedSocket&& other) noexcept : handle_(other.handle_) {
        other.handle_ = kInvalidSocket;
    }
    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            reset();
            handle_ = other.handle_;
            other.handle_ = kInvalidSocket;
        }
        return *this;
    }
    ~ScopedSocket() { reset(); }

    NativeSocket get() const { return handle_; }
    bool valid() const { return handle_ != kInvalidSocket; }
    explicit operator bool() const { return valid(); }

    void reset(NativeSocket handle = kInvalidSocket);

private:
    NativeSocket handle_{kInvalidSocket};
};

struct Endpoint {
    std::string host;
    std::uint16_t port{0};
};

// "host:port" or "[v6]:port"; the last ':' separates the port. Port 0 is
// accepted (bind-any).
std::optional<Endpoint> parse_endpoint(std::string_view text);
std::string describe_endpoint(const Endpoint& endpoint);

// Keeps the socket out of processes spawned by the dispatcher.
void set_close_on_exec(NativeSocket socket);

// All three return an invalid socket on failure; format_socket_error() describes
// why. Every socket they hand out is close-on-exec. open_connection tries each
// resolved address in turn.
ScopedSocket open_connection(const Endpoint& endpoint);
ScopedSocket open_listener(const Endpoint& endpoint, int backlog);
ScopedSocket accept_connection(NativeSocket listener);

std::optional<std::uint16_t> local_port(NativeSocket socket);
std::string peer_endpoint(NativeSocket socket);

bool send_all(NativeSocket socket, const std::uint8_t* data, std::size_t length);
bool send_text(NativeSocket socket, std::string_view text);

// true: readable (data, EOF or pending accept). false: the wait elapsed or failed.
bool wait_readable(NativeSocket socket, std::chrono::milliseconds timeout);

int last_socket_error();
std::string format_socket_error(const std::string& prefix);

// Buffered '\n'-delimited reader over a connected socket. An unterminated tail
// before EOF counts as a final line; a trailing '\r' is dropped.
class LineReader {
public:
    LineReader(NativeSocket socket, std::size_t max_line_length);

    std::optional<std::string> read_line();

    [[nodiscard]] bool overflowed() const noexcept { return overflowed_; }

private:
    bool fill();

    NativeSocket socket_;
    std::size_t max_line_length_;
    std::string buffer_;
    bool eof_{false};
    bool overflowed_{false};
};

}  // namespace crier::network
