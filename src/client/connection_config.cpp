#include "supex/client/connection_config.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace supex {

namespace {

tl::unexpected<ConfigError> invalid(const std::string& variable, const std::string& value, const char* expected) {
    return tl::unexpected(ConfigError{
        variable,
        variable + "='" + value + "' is not " + expected
    });
}

tl::expected<std::uint64_t, ConfigError> parse_unsigned(
    const std::string& variable,
    const std::string& value,
    std::uint64_t max
) {
    std::uint64_t parsed = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    const bool consumed_all = (ptr == last);
    if (value.empty() || ec != std::errc{} || consumed_all == false || parsed > max) {
        return invalid(variable, value, "a valid non-negative integer");
    }
    return parsed;
}

std::chrono::milliseconds clamp_duration(std::chrono::milliseconds value) {
    return std::clamp(value, std::chrono::milliseconds{0}, kMaxDuration);
}

/// Seconds (fractional allowed, at most kMaxDuration) to milliseconds
tl::expected<std::chrono::milliseconds, ConfigError> parse_seconds(
    const std::string& variable,
    const std::string& value
) {
    double seconds = 0.0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, seconds);
    const bool consumed_all = (ptr == last);
    if (value.empty() || ec != std::errc{} || consumed_all == false ||
        std::isfinite(seconds) == false || seconds < 0.0) {
        return invalid(variable, value, "a valid number of seconds");
    }
    const double max_seconds = std::chrono::duration<double>(kMaxDuration).count();
    if (seconds > max_seconds) {
        return invalid(variable, value, "a number of seconds up to 86400");
    }
    return std::chrono::milliseconds{static_cast<std::int64_t>(std::llround(seconds * 1000.0))};
}

}  // namespace

std::optional<std::string> system_env_lookup(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

// ─────────────────────────────────────────────────────────────────────────────
// Builder Methods
// ─────────────────────────────────────────────────────────────────────────────

ConnectionConfig& ConnectionConfig::with_host(std::string value) {
    host = std::move(value);
    return *this;
}

ConnectionConfig& ConnectionConfig::with_port(std::uint16_t value) {
    port = value;
    return *this;
}

ConnectionConfig& ConnectionConfig::with_timeout(std::chrono::milliseconds value) {
    timeout = clamp_duration(value);
    return *this;
}

ConnectionConfig& ConnectionConfig::with_max_retries(std::size_t value) {
    max_retries = value;
    retry_policy.with_max_retries(value);
    return *this;
}

ConnectionConfig& ConnectionConfig::with_max_response_bytes(std::size_t value) {
    max_response_bytes = value;
    return *this;
}

ConnectionConfig& ConnectionConfig::with_token(std::string value) {
    token = std::move(value);
    return *this;
}

ConnectionConfig& ConnectionConfig::without_token() {
    token.reset();
    return *this;
}

ConnectionConfig& ConnectionConfig::with_max_idle(std::chrono::milliseconds value) {
    max_idle = clamp_duration(value);
    return *this;
}

ConnectionConfig& ConnectionConfig::with_agent(std::string value) {
    agent = std::move(value);
    return *this;
}

ConnectionConfig& ConnectionConfig::with_retry_policy(RetryPolicy policy) {
    retry_policy = policy;
    max_retries = policy.max_retries();
    return *this;
}

ConnectionConfig& ConnectionConfig::with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
    backoff_policy = policy ? std::move(policy) : std::make_shared<NoBackoff>();
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// Environment
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<ConnectionConfig, ConfigError> ConnectionConfig::from_environment(const EnvLookup& lookup) {
    ConnectionConfig config;

    if (auto host = lookup("SUPEX_HOST"); host && host->empty() == false) {
        config.host = *host;
    }

    if (auto port = lookup("SUPEX_PORT")) {
        auto parsed = parse_unsigned("SUPEX_PORT", *port, std::numeric_limits<std::uint16_t>::max());
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        if (*parsed == 0) {
            return invalid("SUPEX_PORT", *port, "a port in 1..65535");
        }
        config.port = static_cast<std::uint16_t>(*parsed);
    }

    if (auto timeout = lookup("SUPEX_TIMEOUT")) {
        auto parsed = parse_seconds("SUPEX_TIMEOUT", *timeout);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        if (parsed->count() <= 0) {
            return invalid("SUPEX_TIMEOUT", *timeout, "a positive number of seconds");
        }
        config.timeout = *parsed;
    }

    if (auto retries = lookup("SUPEX_RETRIES")) {
        auto parsed = parse_unsigned("SUPEX_RETRIES", *retries, 1000);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        config.with_max_retries(static_cast<std::size_t>(*parsed));
    }

    if (auto max_response = lookup("SUPEX_MAX_RESPONSE")) {
        auto parsed = parse_unsigned(
            "SUPEX_MAX_RESPONSE", *max_response, std::numeric_limits<std::size_t>::max());
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        if (*parsed == 0) {
            return invalid("SUPEX_MAX_RESPONSE", *max_response, "a positive byte count");
        }
        config.max_response_bytes = static_cast<std::size_t>(*parsed);
    }

    // An empty token means "no token"
    if (auto token = lookup("SUPEX_AUTH_TOKEN"); token && token->empty() == false) {
        config.token = *token;
    }

    if (auto max_idle = lookup("SUPEX_MAX_IDLE")) {
        auto parsed = parse_seconds("SUPEX_MAX_IDLE", *max_idle);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        config.max_idle = *parsed;
    }

    if (auto agent = lookup("SUPEX_AGENT"); agent && agent->empty() == false) {
        config.agent = *agent;
    }

    return config;
}

}  // namespace supex
