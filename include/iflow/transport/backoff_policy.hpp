#ifndef IFLOW_TRANSPORT_BACKOFF_POLICY_HPP
#define IFLOW_TRANSPORT_BACKOFF_POLICY_HPP

#include <chrono>
#include <cstddef>

namespace iflow {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Delay between attempts of a bounded retry loop: initialize send retries and
// WebSocket connection establishment.
//
// Usage:
//   for (std::size_t attempt = 0; attempt < max_attempts; ++attempt) {
//       if (try_once()) break;
//       std::this_thread::sleep_for(policy->next_delay(attempt));
//   }

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    /// attempt: 0-indexed retry number (0 = first retry after initial failure)
    [[nodiscard]] virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff - fixed delay between attempts
// ─────────────────────────────────────────────────────────────────────────────

class ConstantBackoff final : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    [[nodiscard]] std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return delay_;
    }

private:
    std::chrono::milliseconds delay_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff - zero delay, for fast unit tests
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff final : public IBackoffPolicy {
public:
    [[nodiscard]] std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }
};

}  // namespace iflow

#endif  // IFLOW_TRANSPORT_BACKOFF_POLICY_HPP
