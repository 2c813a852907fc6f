#pragma once

#include <atomic>
#include <csignal>

namespace bxfer::infra {

// Cooperative cancellation flag polled by transfer workers between chunks.
// In-flight chunks always run to completion.
class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
};

// Routes SIGINT/SIGTERM to `token`. The token must outlive the handler;
// call uninstall_signal_handler() before destroying it.
void install_signal_handler(CancelToken& token);
void uninstall_signal_handler();

} // namespace bxfer::infra
