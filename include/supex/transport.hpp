#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by the socket, the line codec and the connection layer.
//
// For the socket itself, use: #include "supex/transport/tcp_socket.hpp"
// For framing, use: #include "supex/protocol/line_codec.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace supex {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Network,   // Socket could not be opened, reset, closed by peer
        Timeout,   // Nothing arrived within the configured timeout
        Protocol,  // Truncated frame or frame over the size limit
        Parse      // Complete frame that is not valid JSON
    };

    Category category{};
    std::string message;
    std::optional<int> os_error{};  // errno, when the failure came from a syscall
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:  return "Network";
        case TransportError::Category::Timeout:  return "Timeout";
        case TransportError::Category::Protocol: return "Protocol";
        case TransportError::Category::Parse:    return "Parse";
    }
    return "Unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

// ─────────────────────────────────────────────────────────────────────────────
// IByteSource - anything the line codec can pull bytes from
// ─────────────────────────────────────────────────────────────────────────────

class IByteSource {
public:
    virtual ~IByteSource() = default;

    /// Read up to `capacity` bytes, waiting at most `timeout`.
    /// Returns the number of bytes read; 0 means the peer closed the stream.
    virtual TransportResult<std::size_t> read_some(
        char* dest,
        std::size_t capacity,
        std::chrono::milliseconds timeout
    ) = 0;
};

}  // namespace supex
