#pragma once

#include "supex/protocol/line_codec.hpp"
#include "supex/transport/backoff_policy.hpp"
#include "supex/transport/retry_policy.hpp"
#include "supex/version.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace supex {

// ═══════════════════════════════════════════════════════════════════════════
// Connection Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Recognized environment variables (all optional):
//
//   SUPEX_HOST          host name or address        (default "localhost")
//   SUPEX_PORT          TCP port                    (default 9876)
//   SUPEX_TIMEOUT       request timeout, seconds    (default 15)
//   SUPEX_RETRIES       retries after first attempt (default 2)
//   SUPEX_MAX_RESPONSE  max response size, bytes    (default 10485760)
//   SUPEX_AUTH_TOKEN    token sent in the handshake (default unset)
//   SUPEX_MAX_IDLE      idle seconds before reconnect, 0 = never (default 300)
//   SUPEX_AGENT         agent identity              (default "unknown")
//
// SUPEX_TIMEOUT and SUPEX_MAX_IDLE above 86400 seconds are rejected; the
// with_timeout/with_max_idle builders clamp to the same range.

inline constexpr std::uint16_t kDefaultPort = 9876;

/// Upper bound for timeout and max_idle; keeps deadline arithmetic in range
inline constexpr std::chrono::milliseconds kMaxDuration{std::chrono::hours{24}};

struct ConfigError {
    std::string variable;
    std::string message;
};

/// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// EnvLookup backed by std::getenv
[[nodiscard]] std::optional<std::string> system_env_lookup(const std::string& name);

struct ConnectionConfig {
    std::string host{"localhost"};
    std::uint16_t port{kDefaultPort};

    /// Applies to connect, each send, and each complete response frame
    std::chrono::milliseconds timeout{15'000};

    /// Retries after the first attempt; takes precedence over retry_policy.max_retries()
    std::size_t max_retries{2};

    /// Which failure categories are retried
    RetryPolicy retry_policy{};
    std::size_t max_response_bytes{kDefaultMaxFrameBytes};

    std::optional<std::string> token;

    /// A connection unused for longer than this is replaced before reuse (0 = never)
    std::chrono::milliseconds max_idle{300'000};

    std::string agent{"unknown"};

    // Client identification for the hello handshake
    std::string client_name{kClientName};
    std::string client_version{kClientVersion};

    /// Delay before reconnecting for a retry
    std::shared_ptr<IBackoffPolicy> backoff_policy{std::make_shared<NoBackoff>()};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder Methods
    // ─────────────────────────────────────────────────────────────────────────

    ConnectionConfig& with_host(std::string value);
    ConnectionConfig& with_port(std::uint16_t value);
    ConnectionConfig& with_timeout(std::chrono::milliseconds value);
    ConnectionConfig& with_max_retries(std::size_t value);
    ConnectionConfig& with_max_response_bytes(std::size_t value);
    ConnectionConfig& with_token(std::string value);
    ConnectionConfig& without_token();
    ConnectionConfig& with_max_idle(std::chrono::milliseconds value);
    ConnectionConfig& with_agent(std::string value);
    ConnectionConfig& with_retry_policy(RetryPolicy policy);
    ConnectionConfig& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy);

    /// Defaults overlaid with SUPEX_* variables read through `lookup`.
    [[nodiscard]] static tl::expected<ConnectionConfig, ConfigError> from_environment(
        const EnvLookup& lookup = system_env_lookup
    );
};

}  // namespace supex
