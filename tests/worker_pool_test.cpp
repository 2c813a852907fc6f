#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include "core/chunk_planner/chunk_planner.hpp"
#include "core/worker_pool/worker_pool.hpp"

using namespace bxfer;

namespace {

constexpr infra::RetryPolicy kFastRetry{
    .max_attempts = 3,
    .initial_delay = std::chrono::milliseconds(1),
    .backoff_factor = 1.0,
};

auto pointers(std::vector<core::Chunk>& chunks) -> std::vector<core::Chunk*> {
    std::vector<core::Chunk*> out;
    for (auto& c : chunks) out.push_back(&c);
    return out;
}

} // namespace

TEST(WorkerPoolTest, FinishesEveryChunk)
{
    auto chunks = core::plan_chunks(0, 1000, 10);
    std::atomic<std::uint64_t> bytes{0};

    core::TransferWorkerPool pool(4, kFastRetry);
    auto report = pool.run(pointers(chunks), [&](const core::Chunk& c) -> infra::VoidResult {
        bytes += c.length;
        return {};
    });

    EXPECT_EQ(report.finished, 100u);
    EXPECT_EQ(report.errored, 0u);
    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(bytes.load(), 1000u);
    for (const auto& c : chunks) {
        EXPECT_EQ(c.state, core::ChunkState::Finished);
    }
}

TEST(WorkerPoolTest, UsesRequestedThreadCount)
{
    auto chunks = core::plan_chunks(0, 64, 1);
    std::mutex mutex;
    std::set<std::thread::id> seen;

    core::TransferWorkerPool pool(4, kFastRetry);
    EXPECT_EQ(pool.thread_count(), 4u);
    auto report = pool.run(pointers(chunks), [&](const core::Chunk&) -> infra::VoidResult {
        {
            std::lock_guard lock(mutex);
            seen.insert(std::this_thread::get_id());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return {};
    });

    EXPECT_EQ(report.finished, 64u);
    EXPECT_LE(seen.size(), 4u);
    EXPECT_GE(seen.size(), 2u);
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne)
{
    core::TransferWorkerPool pool(0);
    EXPECT_EQ(pool.thread_count(), 1u);
}

TEST(WorkerPoolTest, TransientFailureIsRetried)
{
    auto chunks = core::plan_chunks(0, 30, 10);
    std::atomic<int> failures_left{2};

    core::TransferWorkerPool pool(2, kFastRetry);
    auto report = pool.run(pointers(chunks), [&](const core::Chunk& c) -> infra::VoidResult {
        if (c.index == 1 && failures_left.fetch_sub(1) > 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::TransferFailure, "flaky"));
        }
        return {};
    });

    EXPECT_EQ(report.finished, 3u);
    EXPECT_EQ(report.errored, 0u);
    EXPECT_EQ(chunks[1].state, core::ChunkState::Finished);
    EXPECT_EQ(chunks[1].retry_count, 2);
}

TEST(WorkerPoolTest, RetryCeilingLeavesChunkErrored)
{
    auto chunks = core::plan_chunks(0, 30, 10);
    std::atomic<int> attempts{0};
    std::vector<std::size_t> failed;

    core::TransferWorkerPool pool(2, kFastRetry);
    auto report = pool.run(pointers(chunks),
        [&](const core::Chunk& c) -> infra::VoidResult {
            if (c.index == 2) {
                ++attempts;
                return std::unexpected(infra::make_error(infra::ErrorCode::Io, "broken"));
            }
            return {};
        },
        nullptr,
        [&](const core::Chunk& c, const infra::Error* err) {
            if (err) failed.push_back(c.index);
        });

    EXPECT_EQ(report.finished, 2u);
    EXPECT_EQ(report.errored, 1u);
    EXPECT_EQ(attempts.load(), kFastRetry.max_attempts);
    EXPECT_EQ(chunks[2].state, core::ChunkState::Errored);
    EXPECT_EQ(failed, std::vector<std::size_t>{2});
}

TEST(WorkerPoolTest, PermanentFailureIsNotRetried)
{
    auto chunks = core::plan_chunks(0, 10, 10);
    std::atomic<int> attempts{0};

    core::TransferWorkerPool pool(1, kFastRetry);
    auto report = pool.run(pointers(chunks), [&](const core::Chunk&) -> infra::VoidResult {
        ++attempts;
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied, "denied"));
    });

    EXPECT_EQ(report.errored, 1u);
    EXPECT_EQ(attempts.load(), 1);
    EXPECT_EQ(chunks[0].retry_count, 1);
}

// The chunk that triggers cancellation still completes; nothing else starts
TEST(WorkerPoolTest, CancellationStopsDispatch)
{
    auto chunks = core::plan_chunks(0, 100, 10);
    infra::CancelToken cancel;
    std::atomic<int> started{0};

    core::TransferWorkerPool pool(1, kFastRetry);
    auto report = pool.run(pointers(chunks), [&](const core::Chunk&) -> infra::VoidResult {
        if (++started == 3) {
            cancel.cancel();
        }
        return {};
    }, &cancel);

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.finished, 3u);
    EXPECT_EQ(report.waiting, 7u);
    EXPECT_EQ(started.load(), 3);
    for (std::size_t i = 3; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].state, core::ChunkState::Waiting);
    }
}

TEST(WorkerPoolTest, CancelDuringLastChunkIsNotCancellation)
{
    auto chunks = core::plan_chunks(0, 100, 10);
    infra::CancelToken cancel;
    std::atomic<int> started{0};

    core::TransferWorkerPool pool(1, kFastRetry);
    auto report = pool.run(pointers(chunks), [&](const core::Chunk&) -> infra::VoidResult {
        if (++started == 10) {
            cancel.cancel();
        }
        return {};
    }, &cancel);

    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(report.finished, 10u);
    EXPECT_EQ(report.waiting, 0u);
}

TEST(WorkerPoolTest, AlreadyCancelledRunsNothing)
{
    auto chunks = core::plan_chunks(0, 50, 10);
    infra::CancelToken cancel;
    cancel.cancel();

    core::TransferWorkerPool pool(3, kFastRetry);
    auto report = pool.run(pointers(chunks), [](const core::Chunk&) -> infra::VoidResult {
        ADD_FAILURE() << "transfer should not run";
        return {};
    }, &cancel);

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.finished, 0u);
    EXPECT_EQ(report.waiting, 5u);
}

TEST(WorkerPoolTest, EmptyInputReturnsImmediately)
{
    core::TransferWorkerPool pool(4, kFastRetry);
    auto report = pool.run({}, [](const core::Chunk&) -> infra::VoidResult { return {}; });
    EXPECT_EQ(report.finished, 0u);
    EXPECT_FALSE(report.cancelled);
}
