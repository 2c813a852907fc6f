#include "interrupt.hpp"
#include <spdlog/spdlog.h>

namespace bxfer::infra {

namespace {

std::atomic<CancelToken*> g_signal_token{nullptr};

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        // Only async-signal-safe work here: flip the flag, log later
        if (auto* token = g_signal_token.load(std::memory_order_relaxed)) {
            token->cancel();
        }
    }
}

} // namespace

void install_signal_handler(CancelToken& token) {
    g_signal_token.store(&token, std::memory_order_relaxed);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    spdlog::debug("Interrupt signals routed to cancel token");
}

void uninstall_signal_handler() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_signal_token.store(nullptr, std::memory_order_relaxed);
}

} // namespace bxfer::infra
