#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace docflow {

struct ChannelConfig;

/**
 * Exponential backoff with jitter for reconnection attempts.
 *
 *   delay(attempt) = min(max_delay, base * 2^(attempt-1)) + jitter
 *
 * where jitter is uniform in [0, jitter_ratio * capped_delay). Attempts are
 * 1-based. The jitter source returns values in [0, 1) and can be replaced to
 * make delays deterministic.
 */
class BackoffPolicy {
public:
    using JitterSource = std::function<double()>;

    BackoffPolicy(std::chrono::milliseconds base_delay,
                  std::chrono::milliseconds max_delay,
                  uint32_t max_retries,
                  double jitter_ratio = 0.3,
                  JitterSource jitter = {});

    static BackoffPolicy from_config(const ChannelConfig& config, JitterSource jitter = {});

    // Delay without jitter
    std::chrono::milliseconds capped_delay(uint32_t attempt) const;

    // Delay including jitter
    std::chrono::milliseconds delay(uint32_t attempt) const;

    // True while another retry may be scheduled after `attempt` retries
    bool should_retry(uint32_t attempt) const { return attempt < max_retries_; }

    uint32_t max_retries() const { return max_retries_; }
    std::chrono::milliseconds max_delay() const { return max_delay_; }

private:
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    uint32_t max_retries_;
    double jitter_ratio_;
    JitterSource jitter_;
};

} // namespace docflow
