#ifndef SUPEX_TRANSPORT_RETRY_POLICY_HPP
#define SUPEX_TRANSPORT_RETRY_POLICY_HPP

#include "supex/transport.hpp"

#include <cstddef>

namespace supex {

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides whether a failed request/response exchange is repeated on a fresh
// connection. IBackoffPolicy decides how long to wait first.
//
// Default behavior:
// - Retry on: network failures (reset, broken pipe, peer close), timeouts,
//   protocol framing errors (truncated or oversized frames)
// - Never retry: parse errors. The same bytes would come back malformed.
//
// Application errors reported by the peer never reach this policy.
//
// Usage:
//   RetryPolicy policy;
//   policy.with_max_retries(2);
//
//   if (policy.should_retry(error.category, retries_so_far)) {
//       // reconnect and resend
//   }

class RetryPolicy {
public:
    RetryPolicy() = default;

    explicit RetryPolicy(std::size_t max_retries)
        : max_retries_(max_retries)
    {}

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration (Builder Pattern)
    // ─────────────────────────────────────────────────────────────────────────

    /// Retries after the initial attempt (2 means 3 attempts in total).
    RetryPolicy& with_max_retries(std::size_t retries) {
        max_retries_ = retries;
        return *this;
    }

    RetryPolicy& with_retry_on_network_error(bool enable) {
        retry_on_network_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_timeout(bool enable) {
        retry_on_timeout_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_protocol_error(bool enable) {
        retry_on_protocol_ = enable;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Query Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t max_retries() const noexcept {
        return max_retries_;
    }

    [[nodiscard]] std::size_t max_attempts() const noexcept {
        return max_retries_ + 1;
    }

    /// Is this category worth retrying at all, ignoring the budget?
    [[nodiscard]] bool is_retryable(TransportError::Category category) const noexcept {
        switch (category) {
            case TransportError::Category::Network:
                return retry_on_network_;

            case TransportError::Category::Timeout:
                return retry_on_timeout_;

            case TransportError::Category::Protocol:
                return retry_on_protocol_;

            case TransportError::Category::Parse:
                return false;
        }

        return false;
    }

    /// @param retries_so_far Retries already performed (0 after the first failure)
    [[nodiscard]] bool should_retry(TransportError::Category category, std::size_t retries_so_far) const noexcept {
        const bool within_limit = (retries_so_far < max_retries_);
        if (within_limit == false) {
            return false;
        }
        return is_retryable(category);
    }

private:
    std::size_t max_retries_{2};
    bool retry_on_network_{true};
    bool retry_on_timeout_{true};
    bool retry_on_protocol_{true};
};

}  // namespace supex

#endif  // SUPEX_TRANSPORT_RETRY_POLICY_HPP
