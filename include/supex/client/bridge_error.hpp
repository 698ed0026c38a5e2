#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Bridge Error
// ═══════════════════════════════════════════════════════════════════════════
// The error type every caller of Connection::send_command() sees.
//
// The four kinds need different remediation, so they stay distinct:
//   Connection - "is the host application running?"
//   Timeout    - no reply in time (normally folded into Connection once the
//                retry budget is spent)
//   Protocol   - the reply was truncated, oversized or not JSON
//   Remote     - the host ran the command and reported a failure; show the
//                code, message and hint

#include "supex/protocol/json_rpc.hpp"
#include "supex/transport.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace supex {

enum class BridgeErrorCode {
    Connection,  ///< Socket could not be opened, handshake failed, peer went away, retries exhausted
    Timeout,     ///< No bytes arrived within the configured timeout
    Protocol,    ///< Response truncated, over the size limit, or not valid JSON
    Remote       ///< JSON-RPC error member returned by the host
};

[[nodiscard]] constexpr std::string_view to_string(BridgeErrorCode code) noexcept {
    switch (code) {
        case BridgeErrorCode::Connection: return "Connection";
        case BridgeErrorCode::Timeout:    return "Timeout";
        case BridgeErrorCode::Protocol:   return "Protocol";
        case BridgeErrorCode::Remote:     return "Remote";
        default:                          return "Unknown";
    }
}

/// Application-level failure reported by the host. `data` is passed through
/// untouched; the accessors read the keys the runtime conventionally sets.
struct RemoteErrorInfo {
    std::int64_t code{-1};
    std::string message;
    std::optional<Json> data;

    [[nodiscard]] std::optional<std::string> hint() const { return string_field("hint"); }
    [[nodiscard]] std::optional<std::string> file() const { return string_field("file"); }

    [[nodiscard]] std::optional<std::int64_t> line() const {
        if (!data || !data->is_object() || !data->contains("line")) {
            return std::nullopt;
        }
        const Json& node = data->at("line");
        if (node.is_number_integer()) {
            return node.get<std::int64_t>();
        }
        return std::nullopt;
    }

    [[nodiscard]] static RemoteErrorInfo from_rpc_error(const JsonRpcError& err) {
        return {err.code, err.message, err.data};
    }

private:
    [[nodiscard]] std::optional<std::string> string_field(const char* key) const {
        if (!data || !data->is_object() || !data->contains(key)) {
            return std::nullopt;
        }
        const Json& node = data->at(key);
        if (node.is_string()) {
            return node.get<std::string>();
        }
        return node.dump();
    }
};

struct BridgeError {
    BridgeErrorCode code;
    std::string message;
    std::optional<RemoteErrorInfo> remote;               ///< Set only for Remote
    std::optional<TransportError::Category> cause;       ///< Transport failure behind a Connection error

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static BridgeError connection(std::string msg) {
        return {BridgeErrorCode::Connection, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static BridgeError connection(std::string msg, TransportError::Category cause) {
        return {BridgeErrorCode::Connection, std::move(msg), std::nullopt, cause};
    }

    [[nodiscard]] static BridgeError timeout(std::string msg) {
        return {BridgeErrorCode::Timeout, std::move(msg), std::nullopt, TransportError::Category::Timeout};
    }

    /// `cause` tells a bad frame (Protocol) from unparseable JSON (Parse)
    [[nodiscard]] static BridgeError protocol(std::string msg, TransportError::Category cause) {
        return {BridgeErrorCode::Protocol, std::move(msg), std::nullopt, cause};
    }

    [[nodiscard]] static BridgeError from_remote(RemoteErrorInfo info) {
        std::string msg = info.message;
        return {BridgeErrorCode::Remote, std::move(msg), std::move(info), std::nullopt};
    }

    [[nodiscard]] static BridgeError from_rpc_error(const JsonRpcError& err) {
        return from_remote(RemoteErrorInfo::from_rpc_error(err));
    }

    /// Direct mapping of a single transport failure, before any retry decision.
    [[nodiscard]] static BridgeError from_transport(const TransportError& err) {
        switch (err.category) {
            case TransportError::Category::Timeout:
                return timeout(err.message);
            case TransportError::Category::Protocol:
            case TransportError::Category::Parse:
                return protocol(err.message, err.category);
            case TransportError::Category::Network:
            default:
                return connection(err.message, err.category);
        }
    }
};

/// Result type for connection operations
template <typename T>
using BridgeResult = tl::expected<T, BridgeError>;

}  // namespace supex
