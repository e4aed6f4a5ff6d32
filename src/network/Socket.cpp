#include "crier/network/Socket.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>

#ifdef _WIN32
#pragma comment(lib, "Ws2_32.lib")
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace crier::network {

namespace {

#ifdef _WIN32
class WinsockRuntime {
public:
    WinsockRuntime() {
        WSADATA data{};
        if (WSAStartup(MAKEWORD(2, 2), &data) != 0) {
            throw std::runtime_error("WSAStartup failed");
        }
    }
    ~WinsockRuntime() {
        WSACleanup();
    }
};

void ensure_winsock_runtime() {
    static WinsockRuntime runtime;
}

constexpr int kSendFlags = 0;
#else
void ensure_winsock_runtime() {}

#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif
#endif

constexpr std::size_t kReadChunk = 512;

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const {
        if (info) {
            ::freeaddrinfo(info);
        }
    }
};

using AddrInfoList = std::unique_ptr<addrinfo, AddrInfoDeleter>;

// Any address family; an empty host binds the wildcard address.
AddrInfoList resolve(const Endpoint& endpoint, bool passive) {
    ensure_winsock_runtime();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    if (passive) {
        hints.ai_flags = AI_PASSIVE;
    }

    const char* node = endpoint.host.empty() ? nullptr : endpoint.host.c_str();
    const auto service = std::to_string(endpoint.port);

    addrinfo* raw = nullptr;
    if (::getaddrinfo(node, service.c_str(), &hints, &raw) != 0) {
        return AddrInfoList{};
    }
    return AddrInfoList(raw);
}

ScopedSocket create_socket(const addrinfo& entry) {
    ScopedSocket socket(::socket(entry.ai_family, entry.ai_socktype, entry.ai_protocol));
    if (socket) {
        set_close_on_exec(socket.get());
    }
    return socket;
}

}  // namespace

void ScopedSocket::reset(NativeSocket handle) {
    if (handle_ != kInvalidSocket) {
#ifdef _WIN32
        ::shutdown(handle_, SD_BOTH);
        ::closesocket(handle_);
#else
        ::shutdown(handle_, SHUT_RDWR);
        ::close(handle_);
#endif
    }
    handle_ = handle;
}

std::optional<Endpoint> parse_endpoint(std::string_view text) {
    const auto pos = text.rfind(':');
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    auto host = text.substr(0, pos);
    const auto port_text = text.substr(pos + 1);
    if (!host.empty() && host.front() == '[') {
        if (host.size() < 2 || host.back() != ']') {
            return std::nullopt;
        }
        host = host.substr(1, host.size() - 2);
    } else if (host.find(':') != std::string_view::npos) {
        // IPv6 literals need brackets so the port stays unambiguous.
        return std::nullopt;
    }
    if (host.empty() || port_text.empty() || port_text.size() > 5) {
        return std::nullopt;
    }

    std::uint32_t port_value = 0;
    for (const char ch : port_text) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        port_value = port_value * 10 + static_cast<std::uint32_t>(ch - '0');
    }
    if (port_value > 65535u) {
        return std::nullopt;
    }

    Endpoint endpoint{};
    endpoint.host = std::string(host);
    endpoint.port = static_cast<std::uint16_t>(port_value);
    return endpoint;
}

std::string describe_endpoint(const Endpoint& endpoint) {
    if (endpoint.host.find(':') != std::string::npos) {
        return "[" + endpoint.host + "]:" + std::to_string(endpoint.port);
    }
    return endpoint.host + ":" + std::to_string(endpoint.port);
}

void set_close_on_exec(NativeSocket socket) {
#ifdef _WIN32
    ::SetHandleInformation(reinterpret_cast<HANDLE>(socket), HANDLE_FLAG_INHERIT, 0);
#else
    const int opts = ::fcntl(socket, F_GETFD, 0);
    if (opts >= 0) {
        ::fcntl(socket, F_SETFD, opts | FD_CLOEXEC);
    }
#endif
}

ScopedSocket open_connection(const Endpoint& endpoint) {
    const auto addresses = resolve(endpoint, false);
    if (!addresses) {
        errno = EHOSTUNREACH;
        return ScopedSocket{};
    }

    int error = EHOSTUNREACH;
    for (const addrinfo* entry = addresses.get(); entry != nullptr; entry = entry->ai_next) {
        auto socket = create_socket(*entry);
        if (!socket) {
            error = last_socket_error();
            continue;
        }
        if (::connect(socket.get(), entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen)) == 0) {
            return socket;
        }
        error = last_socket_error();
    }
    errno = error;
    return ScopedSocket{};
}

ScopedSocket open_listener(const Endpoint& endpoint, int backlog) {
    const auto addresses = resolve(endpoint, true);
    if (!addresses) {
        errno = EADDRNOTAVAIL;
        return ScopedSocket{};
    }

    int error = EADDRNOTAVAIL;
    for (const addrinfo* entry = addresses.get(); entry != nullptr; entry = entry->ai_next) {
        auto socket = create_socket(*entry);
        if (!socket) {
            error = last_socket_error();
            continue;
        }

        const int opt = 1;
        ::setsockopt(socket.get(), SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt));

        if (::bind(socket.get(), entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen)) == 0 &&
            ::listen(socket.get(), backlog) == 0) {
            return socket;
        }
        error = last_socket_error();
    }
    errno = error;
    return ScopedSocket{};
}

ScopedSocket accept_connection(NativeSocket listener) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    ScopedSocket client(::accept(listener, reinterpret_cast<sockaddr*>(&addr), &len));
    if (client) {
        set_close_on_exec(client.get());
    }
    return client;
}

std::optional<std::uint16_t> local_port(NativeSocket socket) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return std::nullopt;
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
}

std::string peer_endpoint(NativeSocket socket) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return std::string{"unknown"};
    }

    char buffer[INET6_ADDRSTRLEN]{};
    if (addr.ss_family == AF_INET6) {
        const auto* v6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        if (::inet_ntop(AF_INET6, &v6->sin6_addr, buffer, sizeof(buffer))) {
            return describe_endpoint(Endpoint{buffer, ntohs(v6->sin6_port)});
        }
    } else if (addr.ss_family == AF_INET) {
        const auto* v4 = reinterpret_cast<const sockaddr_in*>(&addr);
        if (::inet_ntop(AF_INET, &v4->sin_addr, buffer, sizeof(buffer))) {
            return describe_endpoint(Endpoint{buffer, ntohs(v4->sin_port)});
        }
    }
    return std::string{"unknown"};
}

bool send_all(NativeSocket socket, const std::uint8_t* data, std::size_t length) {
    std::size_t total = 0;
    while (total < length) {
#ifdef _WIN32
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data + total),
                                 static_cast<int>(length - total), kSendFlags);
#else
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data + total),
                                 length - total, kSendFlags);
#endif
        if (sent < 0 && last_socket_error() == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(sent);
    }
    return true;
}

bool send_text(NativeSocket socket, std::string_view text) {
    return send_all(socket, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

bool wait_readable(NativeSocket socket, std::chrono::milliseconds timeout) {
    const auto wait_ms = static_cast<int>(std::max<std::int64_t>(timeout.count(), 0));
#ifdef _WIN32
    WSAPOLLFD descriptor{};
    descriptor.fd = socket;
    descriptor.events = POLLRDNORM;
    const int ready = ::WSAPoll(&descriptor, 1, wait_ms);
#else
    pollfd descriptor{};
    descriptor.fd = socket;
    descriptor.events = POLLIN;
    const int ready = ::poll(&descriptor, 1, wait_ms);
#endif
    return ready > 0;
}

int last_socket_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

std::string format_socket_error(const std::string& prefix) {
    const auto code = last_socket_error();
#ifdef _WIN32
    return prefix + " (WSA" + std::to_string(code) + ")";
#else
    return prefix + " (errno " + std::to_string(code) + ": " + std::strerror(code) + ")";
#endif
}

LineReader::LineReader(NativeSocket socket, std::size_t max_line_length)
    : socket_(socket), max_line_length_(max_line_length) {}

std::optional<std::string> LineReader::read_line() {
    while (true) {
        const auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.size() > max_line_length_) {
                overflowed_ = true;
                return std::nullopt;
            }
            return line;
        }
        if (buffer_.size() > max_line_length_) {
            overflowed_ = true;
            return std::nullopt;
        }
        if (eof_) {
            if (buffer_.empty()) {
                return std::nullopt;
            }
            std::string line = std::move(buffer_);
            buffer_.clear();
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        if (!fill()) {
            eof_ = true;
        }
    }
}

bool LineReader::fill() {
    std::array<char, kReadChunk> chunk{};
    while (true) {
#ifdef _WIN32
        const auto received = ::recv(socket_, chunk.data(), static_cast<int>(chunk.size()), 0);
#else
        const auto received = ::recv(socket_, chunk.data(), chunk.size(), 0);
#endif
        if (received < 0 && last_socket_error() == EINTR) {
            continue;
        }
        if (received <= 0) {
            return false;
        }
        buffer_.append(chunk.data(), static_cast<std::size_t>(received));
        return true;
    }
}

}  // namespace crier::network
