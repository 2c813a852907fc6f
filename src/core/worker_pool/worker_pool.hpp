#pragma once

#include <cstddef>
#include <chrono>
#include <functional>
#include <vector>
#include "../model.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/interrupt.hpp"
#include "../../infra/retry.hpp"

namespace bxfer::core {

struct PoolReport {
    std::size_t finished = 0;   // reached Finished during this run
    std::size_t errored = 0;    // gave up after the retry ceiling
    std::size_t waiting = 0;    // never dispatched because of cancellation
    bool cancelled = false;
};

// Fixed set of workers draining a shared queue of waiting chunks.
//
// Each worker takes one chunk, marks it InProgress, runs the transfer
// function and marks it Finished. A transient failure sends the chunk back
// to the queue until the retry ceiling; any other failure, or the last
// attempt, leaves it Errored. Cancellation is checked only before taking
// the next chunk, so chunks already in flight always complete.
class TransferWorkerPool {
public:
    using TransferFn = std::function<infra::VoidResult(const Chunk&)>;
    // Called once per chunk that reaches a terminal state; `error` is null
    // for Finished. May run concurrently on several workers.
    using CompletionFn = std::function<void(const Chunk&, const infra::Error* error)>;

    explicit TransferWorkerPool(std::size_t nthreads, infra::RetryPolicy policy = {});

    TransferWorkerPool(const TransferWorkerPool&) = delete;
    TransferWorkerPool& operator=(const TransferWorkerPool&) = delete;

    [[nodiscard]] auto run(const std::vector<Chunk*>& chunks,
                           const TransferFn& transfer,
                           const infra::CancelToken* cancel = nullptr,
                           const CompletionFn& on_complete = {}) -> PoolReport;

    [[nodiscard]] auto thread_count() const noexcept -> std::size_t { return nthreads_; }

private:
    static constexpr std::chrono::milliseconds kPollInterval{20};

    std::size_t nthreads_;
    infra::RetryPolicy policy_;
};

} // namespace bxfer::core
