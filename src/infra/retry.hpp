#pragma once

#include "error_handler/error.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <thread>

namespace bxfer::infra {
/*

auto res = infra::with_retry([&]() {
    return store.concat(target, parts);
}, infra::RetryPolicy{ .max_attempts = 3 });


*/
struct RetryPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(100);
    double backoff_factor = 2.0; // exponential backoff

    // Delay before attempt number `attempt + 1` (attempt counts from 0)
    [[nodiscard]] auto delay_for(int attempt) const -> std::chrono::milliseconds {
        return std::chrono::milliseconds(static_cast<long>(
            static_cast<double>(initial_delay.count()) * std::pow(backoff_factor, attempt)));
    }
};

template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {})
    -> decltype(operation())
{
    for (int attempt = 0; attempt < policy.max_attempts; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result;
        }

        const auto& err = result.error();
        if (!err.is_transient() || attempt == policy.max_attempts - 1) {
            return result;
        }

        spdlog::warn("Attempt {}/{} failed: {}", attempt + 1, policy.max_attempts, err.message);
        std::this_thread::sleep_for(policy.delay_for(attempt));
    }

    // max_attempts <= 0: run once without retrying
    return operation();
}

} // namespace bxfer::infra
