#pragma once

#include <vellum/core/types.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <functional>
#include <random>
#include <string_view>
#include <thread>

namespace vellum::core {

// Errors worth another attempt against an external provider
inline bool isTransient(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Timeout:
        case ErrorCode::RateLimited:
        case ErrorCode::NetworkError:
        case ErrorCode::ResourceExhausted:
            return true;
        default:
            return false;
    }
}

struct RetryPolicy {
    std::size_t maxRetries = 4;
    std::chrono::milliseconds initialBackoff{200};
    std::chrono::milliseconds maxBackoff{10000};
    double multiplier = 2.0;
    double jitterFraction = 0.2;

    std::chrono::milliseconds delayFor(std::size_t attempt) const {
        double base = static_cast<double>(initialBackoff.count());
        for (std::size_t i = 0; i < attempt; ++i) {
            base *= multiplier;
            if (base >= static_cast<double>(maxBackoff.count()))
                break;
        }
        base = std::min(base, static_cast<double>(maxBackoff.count()));
        if (jitterFraction > 0.0 && base > 0.0) {
            static thread_local std::mt19937 rng{std::random_device{}()};
            std::uniform_real_distribution<double> dist(0.0, base * jitterFraction);
            base += dist(rng);
        }
        return std::chrono::milliseconds(static_cast<long long>(base));
    }
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void defaultSleep(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

/**
 * Runs `attempt` until it succeeds, fails with a non-transient error, or the
 * policy's retry budget is spent. The last error is returned unchanged.
 */
template <typename Fn>
auto retryTransient(const RetryPolicy& policy, std::string_view label, Fn&& attempt,
                    const Sleeper& sleep = defaultSleep) -> decltype(attempt()) {
    auto result = attempt();
    for (std::size_t retry = 0; retry < policy.maxRetries; ++retry) {
        if (result || !isTransient(result.error().code)) {
            return result;
        }
        auto delay = policy.delayFor(retry);
        spdlog::debug("[Retry] {} failed ({}): {}; retry {}/{} in {}ms", label,
                      result.error().code, result.error().message, retry + 1, policy.maxRetries,
                      delay.count());
        sleep(delay);
        result = attempt();
    }
    return result;
}

} // namespace vellum::core
