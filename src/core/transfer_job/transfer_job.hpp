#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "../model.hpp"
#include "../progress_store/progress_store.hpp"
#include "../../adapters/fs.hpp"
#include "../../adapters/remote_store.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/interrupt.hpp"
#include "../../infra/monitoring/monitoring.hpp"

namespace bxfer::core {

struct TransferRequest {
    std::filesystem::path source;        // remote spec for downloads, local spec for uploads
    std::filesystem::path destination;
    infra::Config config{};
    bool run = true;                     // false: plan only

    ProgressStore* progress_store = nullptr;    // when set, state is saved around every run
    infra::ProgressMonitor* monitor = nullptr;
    const infra::CancelToken* cancel = nullptr; // for the run started by `run = true`
};

struct FileFailure {
    FilePair pair;
    std::string message;
};

struct JobReport {
    std::size_t total_chunks = 0;
    std::size_t finished_chunks = 0;
    std::size_t errored_chunks = 0;
    std::size_t remaining_chunks = 0;   // not finished, errored included
    std::size_t pending_files = 0;      // all chunks finished, final step (merge/verify) outstanding
    bool cancelled = false;
    std::vector<FileFailure> failures;
};

// One logical transfer: the planned file list, a chunk table per file, and
// the machinery to drive those chunks through a worker pool. run() may be
// called repeatedly; each call only touches chunks that are not finished.
class TransferJob {
public:
    virtual ~TransferJob() = default;

    TransferJob(const TransferJob&) = delete;
    TransferJob& operator=(const TransferJob&) = delete;

    /// Queues every unfinished chunk (errored ones get a fresh retry budget),
    /// runs them on `state().threads` workers and finalises completed files.
    /// Returns once the queue drains or `cancel` fires.
    [[nodiscard]] auto run(const infra::CancelToken* cancel = nullptr) -> infra::Result<JobReport>;

    /// keep=true records the job under its fingerprint, keep=false drops it.
    [[nodiscard]] auto save(ProgressStore& store, bool keep = true) const -> infra::VoidResult;

    [[nodiscard]] auto fingerprint() const noexcept -> const std::string& { return state_.fingerprint; }
    [[nodiscard]] auto direction() const noexcept -> Direction { return state_.direction; }
    [[nodiscard]] auto state() const noexcept -> const JobState& { return state_; }

    /// Chunks not in the finished state.
    [[nodiscard]] auto remaining_chunks() const noexcept -> std::size_t {
        return remaining_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] auto is_complete() const -> bool;
    [[nodiscard]] auto report() const -> JobReport;

    [[nodiscard]] auto remote_files() const -> std::vector<std::filesystem::path>;
    [[nodiscard]] auto local_files() const -> std::vector<std::filesystem::path>;

protected:
    TransferJob(JobState state,
                adapters::RemoteStore& remote,
                adapters::fs::LocalFs& local,
                infra::Config config,
                ProgressStore* store,
                infra::ProgressMonitor* monitor);

    // Expands the request and builds the chunk table. `source`/`destination`
    // are the namespaces on either side of `direction`.
    [[nodiscard]] static auto plan(Direction direction,
                                   const TransferRequest& request,
                                   const adapters::Tree& source,
                                   const adapters::Tree& destination) -> infra::Result<JobState>;

    // Adopts a registry entry, keeping its persisted shape (threads, sizes)
    [[nodiscard]] static auto adopt(JobState state, Direction expected, infra::Config& config)
        -> infra::Result<JobState>;

    [[nodiscard]] static auto entries_for(const ProgressStore& store, Direction direction)
        -> infra::Result<Registry>;

    // Destination-side setup before chunks are queued. Problems with single
    // files are recorded on those files through fail_file().
    virtual void prepare() = 0;
    [[nodiscard]] virtual auto transfer_chunk(const Chunk& chunk) -> infra::VoidResult = 0;
    // All chunks of the file are finished and it is not Done yet
    [[nodiscard]] virtual auto finish_file(std::size_t file_index) -> infra::VoidResult = 0;

    // Marks unfinished chunks errored so this run skips the file
    void fail_file(std::size_t file_index, const infra::Error& error);
    // Sends the whole file back to Collecting with every chunk waiting
    void reset_file(std::size_t file_index, std::string_view reason);
    // Finished content failed verification: every chunk errored, back to Collecting
    void reject_file(std::size_t file_index, const infra::Error& error);

    [[nodiscard]] auto io_buffer_size() const noexcept -> std::uint64_t {
        return state_.buffer_size == 0 ? 1 : state_.buffer_size;
    }

    // xxHash64 of a remote object streamed in buffer_size pieces
    [[nodiscard]] auto remote_digest(const std::filesystem::path& path) const -> infra::Result<std::uint64_t>;
    [[nodiscard]] auto contents_match(std::size_t file_index) const -> infra::Result<bool>;

    JobState state_;
    adapters::RemoteStore& remote_;
    adapters::fs::LocalFs& local_;
    infra::Config config_;
    ProgressStore* store_;
    infra::ProgressMonitor* monitor_;

private:
    void autosave_(bool keep);

    std::atomic<std::size_t> remaining_{0};
    bool last_run_cancelled_ = false;
    std::mutex run_mutex_;
};

class Downloader final : public TransferJob {
    // Only the factories below can name a Key
    class Key {
        friend class Downloader;
        Key() = default;
    };

public:
    Downloader(Key, JobState state,
               adapters::RemoteStore& remote,
               adapters::fs::LocalFs& local,
               infra::Config config,
               ProgressStore* store,
               infra::ProgressMonitor* monitor)
        : TransferJob(std::move(state), remote, local, std::move(config), store, monitor)
    {}

    /// Plans `request.source` (remote) into `request.destination` (local)
    /// and, unless request.run is false, runs it.
    [[nodiscard]] static auto create(adapters::RemoteStore& remote,
                                     adapters::fs::LocalFs& local,
                                     const TransferRequest& request)
        -> infra::Result<std::unique_ptr<Downloader>>;

    /// Rebuilds a download from a registry entry.
    [[nodiscard]] static auto from_state(JobState state,
                                         adapters::RemoteStore& remote,
                                         adapters::fs::LocalFs& local,
                                         infra::Config config = {},
                                         ProgressStore* store = nullptr,
                                         infra::ProgressMonitor* monitor = nullptr)
        -> infra::Result<std::unique_ptr<Downloader>>;

    /// Download entries in `store`.
    [[nodiscard]] static auto load(const ProgressStore& store) -> infra::Result<Registry>;

protected:
    void prepare() override;
    [[nodiscard]] auto transfer_chunk(const Chunk& chunk) -> infra::VoidResult override;
    [[nodiscard]] auto finish_file(std::size_t file_index) -> infra::VoidResult override;
};

class Uploader final : public TransferJob {
    // Only the factories below can name a Key
    class Key {
        friend class Uploader;
        Key() = default;
    };

public:
    Uploader(Key, JobState state,
             adapters::RemoteStore& remote,
             adapters::fs::LocalFs& local,
             infra::Config config,
             ProgressStore* store,
             infra::ProgressMonitor* monitor)
        : TransferJob(std::move(state), remote, local, std::move(config), store, monitor)
    {}

    /// Plans `request.source` (local) into `request.destination` (remote)
    /// and, unless request.run is false, runs it.
    [[nodiscard]] static auto create(adapters::RemoteStore& remote,
                                     adapters::fs::LocalFs& local,
                                     const TransferRequest& request)
        -> infra::Result<std::unique_ptr<Uploader>>;

    [[nodiscard]] static auto from_state(JobState state,
                                         adapters::RemoteStore& remote,
                                         adapters::fs::LocalFs& local,
                                         infra::Config config = {},
                                         ProgressStore* store = nullptr,
                                         infra::ProgressMonitor* monitor = nullptr)
        -> infra::Result<std::unique_ptr<Uploader>>;

    /// Upload entries in `store`.
    [[nodiscard]] static auto load(const ProgressStore& store) -> infra::Result<Registry>;

    /// Staged part paths of one file, in chunk order.
    [[nodiscard]] auto part_paths(std::size_t file_index) const -> std::vector<std::filesystem::path>;

protected:
    void prepare() override;
    [[nodiscard]] auto transfer_chunk(const Chunk& chunk) -> infra::VoidResult override;
    // collecting -> merging -> done; a failed merge stays in merging with
    // its parts in place so the next run only repeats the merge.
    [[nodiscard]] auto finish_file(std::size_t file_index) -> infra::VoidResult override;
};

} // namespace bxfer::core
