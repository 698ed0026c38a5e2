#pragma once

#include "supex/client/bridge_error.hpp"
#include "supex/client/connection_config.hpp"
#include "supex/protocol/json_rpc.hpp"
#include "supex/transport/retry_policy.hpp"
#include "supex/transport/tcp_socket.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace supex {

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════
// One persistent, identified TCP session with the host application.
//
//   Disconnected --connect()--> Identified --I/O error, idle, peer close--> Disconnected
//
// send_command() is the only call most code needs: it (re)connects when the
// current session is missing or unhealthy, sends one request, waits for one
// response and retries transport failures on a fresh session.
//
// Usage:
//   Connection conn(ConnectionConfig{}.with_agent("cli"));
//
//   auto result = conn.send_command("get_layers");
//   if (!result) {
//       std::cerr << to_string(result.error().code) << ": " << result.error().message;
//   }
//
// Thread safety: all methods may be called concurrently. Socket use is
// serialized, so concurrent commands on one Connection run one at a time.

class Connection {
public:
    using Clock = std::chrono::steady_clock;

    explicit Connection(ConnectionConfig config);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Drop any current session, open a new socket and run the hello
    /// handshake. Returns false (and stays disconnected) on any failure.
    bool connect();

    /// Close the socket if there is one. Safe to call repeatedly.
    void disconnect() noexcept;

    /// Identified, not idle past max_idle, and the peer has not closed.
    [[nodiscard]] bool is_healthy() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Commands
    // ─────────────────────────────────────────────────────────────────────────

    /// Send `method` and return the response's result.
    ///
    /// Methods other than hello, resources/list and an already-wrapped
    /// tools/call are sent as tools/call {name: method, arguments: params}.
    ///
    /// Errors:
    ///   Connection - could not connect, reconnect failed, or retries exhausted
    ///   Protocol   - response was not a JSON object (not retried), or a bad
    ///                frame the retry policy declines to retry
    ///   Remote     - the host reported an error; code/message/data verbatim
    ///   Timeout    - only when config().retry_policy declines to retry timeouts
    [[nodiscard]] BridgeResult<Json> send_command(
        const std::string& method,
        const Json& params = Json::object(),
        std::optional<JsonRpcId> id = std::nullopt
    );

    // ─────────────────────────────────────────────────────────────────────────
    // State
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] bool is_identified() const;

    /// Time of the last completed request/response cycle (hello included)
    [[nodiscard]] std::optional<Clock::time_point> last_activity() const;

    /// Result of the last successful hello; cleared on disconnect
    [[nodiscard]] std::optional<Json> server_info() const;

    [[nodiscard]] const ConnectionConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::string& agent() const noexcept { return config_.agent; }

private:
    bool connect_locked();
    void disconnect_locked() noexcept;
    [[nodiscard]] bool is_healthy_locked() const;

    /// Write one encoded request and read back one decoded response
    [[nodiscard]] TransportResult<JsonRpcResponse> exchange_locked(const std::string& wire);

    [[nodiscard]] std::string endpoint() const;

    const ConnectionConfig config_;
    const RetryPolicy retry_policy_;

    mutable std::mutex io_mutex_;
    std::optional<TcpSocket> socket_;
    bool identified_{false};
    std::optional<Clock::time_point> last_activity_;
    std::optional<Json> server_info_;
};

}  // namespace supex
