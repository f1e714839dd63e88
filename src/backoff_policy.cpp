#include "docflow/backoff_policy.hpp"
#include "docflow/config.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <random>

namespace docflow {

namespace {

BackoffPolicy::JitterSource default_jitter_source() {
    struct State {
        std::mutex mutex;
        std::mt19937 engine{std::random_device{}()};
        std::uniform_real_distribution<double> distribution{0.0, 1.0};
    };
    auto state = std::make_shared<State>();
    return [state]() {
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->distribution(state->engine);
    };
}

} // namespace

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base_delay,
                             std::chrono::milliseconds max_delay,
                             uint32_t max_retries,
                             double jitter_ratio,
                             JitterSource jitter)
    : base_delay_(base_delay),
      max_delay_(max_delay),
      max_retries_(max_retries),
      jitter_ratio_(std::max(0.0, jitter_ratio)),
      jitter_(jitter ? std::move(jitter) : default_jitter_source()) {}

BackoffPolicy BackoffPolicy::from_config(const ChannelConfig& config, JitterSource jitter) {
    return BackoffPolicy(std::chrono::milliseconds(config.initial_retry_delay_ms),
                         std::chrono::milliseconds(config.max_retry_delay_ms),
                         config.max_retries,
                         config.jitter_ratio,
                         std::move(jitter));
}

std::chrono::milliseconds BackoffPolicy::capped_delay(uint32_t attempt) const {
    if (attempt == 0) {
        attempt = 1;
    }
    // Doubling past 2^30 overflows long before any sane max_delay
    uint32_t exponent = std::min<uint32_t>(attempt - 1, 30);
    double raw = static_cast<double>(base_delay_.count()) * static_cast<double>(1ull << exponent);
    double capped = std::min(raw, static_cast<double>(max_delay_.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

std::chrono::milliseconds BackoffPolicy::delay(uint32_t attempt) const {
    auto base = capped_delay(attempt);
    double sample = std::clamp(jitter_(), 0.0, 1.0);
    auto jitter = static_cast<int64_t>(sample * jitter_ratio_ * static_cast<double>(base.count()));
    return base + std::chrono::milliseconds(jitter);
}

} // namespace docflow
