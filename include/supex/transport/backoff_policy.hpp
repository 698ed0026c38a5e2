#ifndef SUPEX_TRANSPORT_BACKOFF_POLICY_HPP
#define SUPEX_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace supex {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// How long the connection waits before reconnecting for a retry.
// attempt: 0-indexed retry number (0 = first retry after the initial failure)
//
// Policies are shared between connections created from one config, so
// implementations must be safe to call from several threads.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff - reconnect immediately (the default; the peer is local)
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff final : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff
// ─────────────────────────────────────────────────────────────────────────────

class ConstantBackoff final : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return delay_;
    }

private:
    std::chrono::milliseconds delay_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = min(base * multiplier^attempt, max), then scaled by a random factor
// in [1 - jitter, 1 + jitter].
//
// With base=100ms, multiplier=2.0, max=2s:
//   Attempt 0: 100ms, attempt 1: 200ms, attempt 2: 400ms, ... capped at 2s

class ExponentialBackoff final : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(
              std::chrono::milliseconds{100},
              2.0,
              std::chrono::milliseconds{2'000},
              0.25
          ) {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max,
        double jitter_factor  // 0.0 = no jitter, 0.25 = ±25%
    )
        : base_(base)
        , multiplier_(multiplier)
        , max_(max)
        , jitter_factor_(jitter_factor)
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double grown = static_cast<double>(base_.count())
            * std::pow(multiplier_, static_cast<double>(attempt));
        double delay_ms = std::min(grown, static_cast<double>(max_.count()));

        if (jitter_factor_ > 0.0) {
            std::uniform_real_distribution<double> dist(1.0 - jitter_factor_, 1.0 + jitter_factor_);
            std::lock_guard<std::mutex> lock(rng_mutex_);
            delay_ms *= dist(rng_);
        }

        return std::chrono::milliseconds{static_cast<std::int64_t>(std::max(0.0, delay_ms))};
    }

private:
    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

}  // namespace supex

#endif  // SUPEX_TRANSPORT_BACKOFF_POLICY_HPP
