#pragma once

// Platform check - TcpSocket uses BSD sockets and poll()
#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "TcpSocket is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "supex/transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace supex {

/// Result of a non-destructive liveness probe on an idle socket
enum class PeekStatus {
    WouldBlock,   // Nothing waiting; peer presumed alive
    DataPending,  // Unsolicited bytes are waiting to be read
    Closed,       // Peer performed an orderly shutdown
    Error         // Any other read error (reset, bad descriptor, ...)
};

[[nodiscard]] constexpr std::string_view to_string(PeekStatus status) noexcept {
    switch (status) {
        case PeekStatus::WouldBlock:  return "WouldBlock";
        case PeekStatus::DataPending: return "DataPending";
        case PeekStatus::Closed:      return "Closed";
        case PeekStatus::Error:       return "Error";
    }
    return "Unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// TcpSocket
// ═══════════════════════════════════════════════════════════════════════════
// Owns one connected, blocking TCP socket. Every operation that can wait
// takes an explicit timeout and is bounded by poll(), so no call blocks
// forever. Move-only; the destructor closes the descriptor.

class TcpSocket final : public IByteSource {
public:
    TcpSocket() = default;
    ~TcpSocket() override;

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    /// Resolve `host`, connect within `timeout` and disable Nagle's algorithm.
    [[nodiscard]] static TransportResult<TcpSocket> connect(
        const std::string& host,
        std::uint16_t port,
        std::chrono::milliseconds timeout
    );

    /// Write the whole buffer, looping over partial writes.
    [[nodiscard]] TransportResult<void> send_all(
        std::string_view data,
        std::chrono::milliseconds timeout
    );

    TransportResult<std::size_t> read_some(
        char* dest,
        std::size_t capacity,
        std::chrono::milliseconds timeout
    ) override;

    /// MSG_PEEK | MSG_DONTWAIT probe; never consumes data.
    [[nodiscard]] PeekStatus peek() const noexcept;

    /// Close the descriptor. The socket is closed afterwards even on error.
    TransportResult<void> close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int native_handle() const noexcept { return fd_; }

private:
    explicit TcpSocket(int fd) noexcept : fd_(fd) {}

    int fd_{-1};
};

}  // namespace supex
