#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <array>
#include <cstdio>

namespace bxfer::infra {

namespace {

constexpr int kBarWidth = 20;
constexpr auto kRedrawPeriod = std::chrono::milliseconds(100);

auto human_rate(double bytes_per_sec) -> std::string {
    static constexpr std::array<const char*, 4> units{"B/s", "KB/s", "MB/s", "GB/s"};
    std::size_t unit = 0;
    while (bytes_per_sec >= 1024.0 && unit + 1 < units.size()) {
        bytes_per_sec /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", bytes_per_sec, units[unit]);
}

auto human_duration(std::uint64_t seconds) -> std::string {
    const auto h = seconds / 3600;
    const auto m = seconds / 60 % 60;
    const auto s = seconds % 60;
    if (h > 0) return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
    return fmt::format("{:02d}:{:02d}", m, s);
}

} // namespace

auto ProgressMonitor::Stats::bytes_per_second(std::chrono::steady_clock::time_point now) const -> double {
    const double elapsed = std::chrono::duration<double>(now - start_time).count();
    return elapsed > 0 ? static_cast<double>(transferred_bytes) / elapsed : 0.0;
}

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (!enabled_) return;
    painter_ = std::jthread([this](std::stop_token stop) {
        while (!stop.stop_requested()) {
            draw_();
            std::this_thread::sleep_for(kRedrawPeriod);
        }
    });
}

ProgressMonitor::~ProgressMonitor() {
    if (!enabled_) return;
    painter_.request_stop();
    painter_.join();
    draw_();
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

void ProgressMonitor::set_total(std::uint64_t chunks, std::uint64_t bytes,
                                std::uint64_t finished_chunks, std::uint64_t finished_bytes) {
    total_chunks_.store(chunks);
    total_bytes_.store(bytes);
    finished_chunks_.store(finished_chunks);
    transferred_bytes_.store(finished_bytes);
    failed_chunks_.store(0);
}

void ProgressMonitor::chunk_finished(std::uint64_t bytes) {
    finished_chunks_.fetch_add(1, std::memory_order_relaxed);
    transferred_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

void ProgressMonitor::chunk_failed() {
    failed_chunks_.fetch_add(1, std::memory_order_relaxed);
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_chunks = total_chunks_.load(),
        .finished_chunks = finished_chunks_.load(),
        .total_bytes = total_bytes_.load(),
        .transferred_bytes = transferred_bytes_.load(),
        .failed_chunks = failed_chunks_.load(),
        .start_time = start_time_
    };
}

auto ProgressMonitor::format_line(const Stats& stats,
                                  std::chrono::steady_clock::time_point now) -> std::string {
    const auto done = std::min(stats.finished_chunks, stats.total_chunks);
    const int filled = stats.total_chunks == 0
        ? 0
        : static_cast<int>(done * kBarWidth / stats.total_chunks);

    const double rate = stats.bytes_per_second(now);
    std::string eta = "--:--";
    if (rate > 0 && stats.total_bytes > stats.transferred_bytes) {
        eta = human_duration(static_cast<std::uint64_t>(
            static_cast<double>(stats.total_bytes - stats.transferred_bytes) / rate));
    } else if (stats.total_bytes <= stats.transferred_bytes) {
        eta = human_duration(0);
    }

    std::string line = fmt::format("[{}{}] {}/{} chunks | {} | ETA {}",
                                   std::string(filled, '#'), std::string(kBarWidth - filled, '.'),
                                   stats.finished_chunks, stats.total_chunks,
                                   human_rate(rate), eta);
    if (stats.failed_chunks > 0) {
        line += fmt::format(" | {} failed", stats.failed_chunks);
    }
    return line;
}

void ProgressMonitor::draw_() const {
    const auto stats = get_stats();
    if (stats.total_chunks == 0) return;
    fmt::print("\r\033[K{}", format_line(stats, std::chrono::steady_clock::now()));
    std::fflush(stdout);
}

} // namespace bxfer::infra
