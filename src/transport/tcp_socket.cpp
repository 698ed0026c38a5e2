#include "supex/transport/tcp_socket.hpp"
#include "supex/log/logger.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <format>
#include <utility>

namespace supex {

namespace {

#if defined(MSG_NOSIGNAL)
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;  // connect_one sets SO_NOSIGPIPE instead
#endif

TransportError make_error(TransportError::Category cat, std::string msg, int err = 0) {
    TransportError error{cat, std::move(msg), std::nullopt};
    if (err != 0) {
        error.os_error = err;
    }
    return error;
}

TransportError errno_error(const std::string& what, int err) {
    return make_error(
        TransportError::Category::Network,
        what + ": " + std::strerror(err),
        err
    );
}

int to_poll_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return 0;
    }
    constexpr auto kMaxPollMs = std::chrono::milliseconds{0x7fffffff};
    return static_cast<int>(std::min(timeout, kMaxPollMs).count());
}

/// Wait for `events` on fd. Returns 1 when ready, 0 on timeout, -1 on error (errno set).
int wait_for(int fd, short events, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        const int result = ::poll(&pfd, 1, to_poll_timeout(remaining));
        if (result < 0 && errno == EINTR) {
            continue;
        }
        return result > 0 ? 1 : result;
    }
}

bool set_blocking(int fd, bool blocking) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    const int updated = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, updated) == 0;
}

/// Non-blocking connect bounded by `timeout`. Returns the connected fd or an error.
TransportResult<int> connect_one(const struct addrinfo& addr, std::chrono::milliseconds timeout) {
    const int fd = ::socket(addr.ai_family, addr.ai_socktype, addr.ai_protocol);
    if (fd == -1) {
        return tl::unexpected(errno_error("Failed to create socket", errno));
    }

    auto fail = [fd](TransportError error) -> TransportResult<int> {
        ::close(fd);
        return tl::unexpected(std::move(error));
    };

    if (set_blocking(fd, false) == false) {
        return fail(errno_error("Failed to configure socket", errno));
    }

    if (::connect(fd, addr.ai_addr, addr.ai_addrlen) == -1) {
        if (errno != EINPROGRESS) {
            return fail(errno_error("Connection failed", errno));
        }

        const int ready = wait_for(fd, POLLOUT, timeout);
        if (ready == 0) {
            return fail(make_error(
                TransportError::Category::Timeout,
                std::format("Connection attempt timed out after {}ms", timeout.count())
            ));
        }
        if (ready < 0) {
            return fail(errno_error("Connection failed", errno));
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == -1) {
            return fail(errno_error("Connection failed", errno));
        }
        if (so_error != 0) {
            return fail(errno_error("Connection failed", so_error));
        }
    }

    if (set_blocking(fd, true) == false) {
        return fail(errno_error("Failed to configure socket", errno));
    }

    // Small control messages must not sit in Nagle's buffer
    int nodelay = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) == -1) {
        return fail(errno_error("Failed to set TCP_NODELAY", errno));
    }

#if !defined(MSG_NOSIGNAL) && defined(SO_NOSIGPIPE)
    // No per-send flag here; a write to a reset peer must fail with EPIPE, not raise SIGPIPE
    int nosigpipe = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &nosigpipe, sizeof(nosigpipe)) == -1) {
        return fail(errno_error("Failed to set SO_NOSIGPIPE", errno));
    }
#endif

    return fd;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction / Ownership
// ─────────────────────────────────────────────────────────────────────────────

TcpSocket::~TcpSocket() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
{}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

TransportResult<TcpSocket> TcpSocket::connect(
    const std::string& host,
    std::uint16_t port,
    std::chrono::milliseconds timeout
) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* results = nullptr;
    const std::string service = std::to_string(port);
    const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            std::format("Failed to resolve {}: {}", host, ::gai_strerror(rc))
        ));
    }

    // Try each resolved address in order ("localhost" may yield ::1 before 127.0.0.1)
    TransportError last_error = make_error(
        TransportError::Category::Network,
        "No addresses resolved for " + host
    );
    for (const struct addrinfo* addr = results; addr != nullptr; addr = addr->ai_next) {
        auto fd = connect_one(*addr, timeout);
        if (fd.has_value()) {
            ::freeaddrinfo(results);
            return TcpSocket(*fd);
        }
        last_error = std::move(fd.error());
    }

    ::freeaddrinfo(results);
    return tl::unexpected(std::move(last_error));
}

// ─────────────────────────────────────────────────────────────────────────────
// I/O
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> TcpSocket::send_all(std::string_view data, std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        return tl::unexpected(make_error(TransportError::Category::Network, "Socket is not open"));
    }

    const char* ptr = data.data();
    std::size_t remaining = data.size();
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (remaining > 0) {
        const ssize_t written = ::send(fd_, ptr, remaining, kSendFlags | MSG_DONTWAIT);
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                return tl::unexpected(errno_error("Failed to send", errno));
            }

            // Send buffer full: wait for room until the deadline
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            const int ready = wait_for(fd_, POLLOUT, left);
            if (ready == 0) {
                return tl::unexpected(make_error(TransportError::Category::Timeout, "Send timed out"));
            }
            if (ready < 0) {
                return tl::unexpected(errno_error("Failed to send", errno));
            }
            continue;
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
    }

    return {};
}

TransportResult<std::size_t> TcpSocket::read_some(
    char* dest,
    std::size_t capacity,
    std::chrono::milliseconds timeout
) {
    if (fd_ < 0) {
        return tl::unexpected(make_error(TransportError::Category::Network, "Socket is not open"));
    }

    const int ready = wait_for(fd_, POLLIN, timeout);
    if (ready == 0) {
        return tl::unexpected(make_error(
            TransportError::Category::Timeout,
            std::format("No data within {}ms", timeout.count())
        ));
    }
    if (ready < 0) {
        return tl::unexpected(errno_error("Failed to poll socket", errno));
    }

    while (true) {
        const ssize_t n = ::recv(fd_, dest, capacity, 0);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        return tl::unexpected(errno_error("Failed to read", errno));
    }
}

PeekStatus TcpSocket::peek() const noexcept {
    if (fd_ < 0) {
        return PeekStatus::Error;
    }

    char probe = 0;
    while (true) {
        const ssize_t n = ::recv(fd_, &probe, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n > 0) {
            return PeekStatus::DataPending;
        }
        if (n == 0) {
            return PeekStatus::Closed;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return PeekStatus::WouldBlock;
        }
        return PeekStatus::Error;
    }
}

TransportResult<void> TcpSocket::close() noexcept {
    if (fd_ < 0) {
        return {};
    }

    const int fd = std::exchange(fd_, -1);
    if (::close(fd) == -1) {
        const int err = errno;
        try {
            SUPEX_LOG_DEBUG(std::format("close() on fd {} failed: {}", fd, std::strerror(err)));
            return tl::unexpected(errno_error("Failed to close socket", err));
        } catch (const std::exception&) {
            // No room to describe the failure; the errno still travels
            return tl::unexpected(TransportError{TransportError::Category::Network, {}, err});
        }
    }
    return {};
}

}  // namespace supex
