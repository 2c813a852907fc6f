#include "worker_pool.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <spdlog/spdlog.h>

namespace bxfer::core {

TransferWorkerPool::TransferWorkerPool(std::size_t nthreads, infra::RetryPolicy policy)
    : nthreads_(nthreads == 0 ? 1 : nthreads)
    , policy_(policy)
{}

auto TransferWorkerPool::run(const std::vector<Chunk*>& chunks,
                             const TransferFn& transfer,
                             const infra::CancelToken* cancel,
                             const CompletionFn& on_complete) -> PoolReport
{
    PoolReport report;
    if (chunks.empty()) {
        return report;
    }

    std::mutex queue_mutex;
    std::condition_variable cv;
    std::deque<Chunk*> queue;
    std::size_t outstanding = 0;   // queued, in flight, or waiting out a retry delay
    bool cancel_seen = false;

    for (auto* chunk : chunks) {
        chunk->state = ChunkState::Waiting;
        queue.push_back(chunk);
    }
    outstanding = queue.size();

    auto is_cancelled = [cancel] { return cancel != nullptr && cancel->is_cancelled(); };

    auto worker = [&] {
        while (true) {
            Chunk* chunk = nullptr;
            {
                std::unique_lock lock(queue_mutex);
                while (true) {
                    if (queue.empty() && outstanding == 0) return;
                    if (is_cancelled()) {
                        cancel_seen = true;
                        return;
                    }
                    if (!queue.empty()) break;
                    // Other workers may still push a chunk back for retry
                    cv.wait_for(lock, kPollInterval);
                }
                chunk = queue.front();
                queue.pop_front();
                chunk->state = ChunkState::InProgress;
            }

            auto res = transfer(*chunk);

            bool retry = false;
            {
                std::lock_guard lock(queue_mutex);
                if (res) {
                    chunk->state = ChunkState::Finished;
                    ++report.finished;
                    --outstanding;
                } else {
                    ++chunk->retry_count;
                    chunk->state = ChunkState::Errored;
                    retry = res.error().is_transient() && chunk->retry_count < policy_.max_attempts;
                    if (!retry) {
                        ++report.errored;
                        --outstanding;
                    }
                }
            }

            if (res) {
                spdlog::debug("Chunk {}:{} finished ({} bytes)", chunk->file_index, chunk->index, chunk->length);
                if (on_complete) on_complete(*chunk, nullptr);
            } else if (retry) {
                spdlog::warn("Chunk {}:{} failed (attempt {}/{}): {}", chunk->file_index, chunk->index,
                             chunk->retry_count, policy_.max_attempts, res.error().message);
                std::this_thread::sleep_for(policy_.delay_for(chunk->retry_count - 1));
                std::lock_guard lock(queue_mutex);
                chunk->state = ChunkState::Waiting;
                queue.push_back(chunk);
            } else {
                spdlog::error("Chunk {}:{} failed permanently after {} attempt(s): {}",
                              chunk->file_index, chunk->index, chunk->retry_count, res.error().message);
                if (on_complete) on_complete(*chunk, &res.error());
            }
            cv.notify_all();
        }
    };

    {
        std::vector<std::jthread> workers;
        workers.reserve(nthreads_);
        for (std::size_t i = 0; i < nthreads_; ++i) {
            workers.emplace_back(worker);
        }
        // jthread joins on destruction
    }

    report.waiting = queue.size();
    // A cancel that lands after the last chunk finished leaves nothing behind
    report.cancelled = cancel_seen && report.waiting > 0;
    if (report.cancelled) {
        spdlog::info("Transfer cancelled: {} chunk(s) left waiting", report.waiting);
    }
    return report;
}

} // namespace bxfer::core
