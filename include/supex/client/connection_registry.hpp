#pragma once

#include "supex/client/connection.hpp"
#include "supex/client/connection_config.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace supex {

// ═══════════════════════════════════════════════════════════════════════════
// Connection Registry
// ═══════════════════════════════════════════════════════════════════════════
// Owns the one shared Connection of a process, keyed by agent identity.
// Asking for a different agent replaces (and disconnects) the current one.
//
// Create one registry at startup and pass it to whatever issues commands:
//
//   ConnectionRegistry registry(*ConnectionConfig::from_environment());
//   auto conn = registry.acquire("mcp");
//   auto layers = conn->send_command("get_layers");
//
// The registry lock covers lookup and replacement only. Commands run under
// the Connection's own lock, so a slow command never blocks acquire().

class ConnectionRegistry {
public:
    explicit ConnectionRegistry(ConnectionConfig base);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /// Connection for `agent`, created on first use. Never connects; the first
    /// send_command() does. Callers still holding a replaced connection may
    /// keep using it, though it starts out disconnected.
    [[nodiscard]] std::shared_ptr<Connection> acquire(const std::string& agent);

    /// Connection for the base config's agent
    [[nodiscard]] std::shared_ptr<Connection> acquire();

    /// Agent of the current connection, if one has been created
    [[nodiscard]] std::optional<std::string> current_agent() const;

    /// Disconnect and forget the current connection
    void reset() noexcept;

    [[nodiscard]] const ConnectionConfig& base_config() const noexcept { return base_; }

private:
    const ConnectionConfig base_;

    mutable std::mutex mutex_;
    std::shared_ptr<Connection> current_;
};

}  // namespace supex
