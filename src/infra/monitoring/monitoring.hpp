#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace bxfer::infra {

// Counts chunks and bytes moved by a job and, when attached to a terminal,
// redraws a one-line progress bar from a background thread.
class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_chunks = 0;
        std::uint64_t finished_chunks = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t transferred_bytes = 0;
        std::uint64_t failed_chunks = 0;
        std::chrono::steady_clock::time_point start_time{};

        [[nodiscard]] auto bytes_per_second(std::chrono::steady_clock::time_point now) const -> double;
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    // Resumed jobs pass what already finished as the starting point
    void set_total(std::uint64_t chunks, std::uint64_t bytes,
                   std::uint64_t finished_chunks = 0, std::uint64_t finished_bytes = 0);
    void chunk_finished(std::uint64_t bytes);
    void chunk_failed();

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    // Status line for the given snapshot, without terminal control codes
    [[nodiscard]] static auto format_line(const Stats& stats,
                                          std::chrono::steady_clock::time_point now) -> std::string;

private:
    void draw_() const;

    std::atomic<std::uint64_t> finished_chunks_{0};
    std::atomic<std::uint64_t> transferred_bytes_{0};
    std::atomic<std::uint64_t> failed_chunks_{0};
    std::atomic<std::uint64_t> total_chunks_{0};
    std::atomic<std::uint64_t> total_bytes_{0};

    const bool enabled_;
    const std::chrono::steady_clock::time_point start_time_;
    std::jthread painter_;
};

} // namespace bxfer::infra
