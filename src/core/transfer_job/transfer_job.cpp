#include "transfer_job.hpp"
#include <algorithm>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../chunk_planner/chunk_planner.hpp"
#include "../path_expander/path_expander.hpp"
#include "../worker_pool/worker_pool.hpp"
#include "../../infra/hash/hasher.hpp"

namespace bxfer::core {

TransferJob::TransferJob(JobState state,
                         adapters::RemoteStore& remote,
                         adapters::fs::LocalFs& local,
                         infra::Config config,
                         ProgressStore* store,
                         infra::ProgressMonitor* monitor)
    : state_(std::move(state))
    , remote_(remote)
    , local_(local)
    , config_(std::move(config))
    , store_(store)
    , monitor_(monitor)
    , remaining_(state_.count_unfinished_chunks())
{}

auto TransferJob::plan(Direction direction,
                       const TransferRequest& request,
                       const adapters::Tree& source,
                       const adapters::Tree& destination) -> infra::Result<JobState>
{
    PathExpander expander(source, destination);
    auto files = expander.expand(request.source, request.destination);
    if (!files) {
        return std::unexpected(infra::log_and_return(std::move(files.error())));
    }

    JobState state;
    state.direction = direction;
    state.source_spec = request.source.string();
    state.dest_spec = request.destination.string();
    state.threads = request.config.effective_threads();
    state.chunk_size = request.config.effective_chunk_size();
    state.buffer_size = request.config.effective_buffer_size();
    state.job_id = generate_job_id();
    if (direction == Direction::Upload) {
        state.temp_dir = request.config.effective_temp_dir();
    }

    state.files.reserve(files->size());
    for (auto& file : *files) {
        const auto index = state.files.size();
        FileEntry entry;
        if (direction == Direction::Download) {
            entry.pair = FilePair{.remote = std::move(file.source), .local = std::move(file.destination)};
        } else {
            entry.pair = FilePair{.remote = std::move(file.destination), .local = std::move(file.source)};
        }
        entry.size = file.size;
        entry.chunks = plan_chunks(index, file.size, state.chunk_size);
        state.files.push_back(std::move(entry));
    }

    state.fingerprint = compute_fingerprint(state);
    spdlog::debug("Planned {} job {}: {} file(s), {} chunk(s)",
                  to_string(direction), state.fingerprint, state.files.size(), state.total_chunks());
    return state;
}

auto TransferJob::adopt(JobState state, Direction expected, infra::Config& config) -> infra::Result<JobState> {
    if (state.direction != expected) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CorruptState,
            fmt::format("Registry entry {} is an {} job", state.fingerprint, to_string(state.direction))));
    }

    for (std::size_t i = 0; i < state.files.size(); ++i) {
        for (auto& chunk : state.files[i].chunks) {
            chunk.file_index = i;
            if (chunk.state == ChunkState::InProgress) {
                chunk.state = ChunkState::Waiting;
            }
        }
    }
    if (state.fingerprint.empty()) {
        state.fingerprint = compute_fingerprint(state);
    }

    config.threads = state.threads;
    config.chunk_size = state.chunk_size;
    config.buffer_size = state.buffer_size;
    if (!state.temp_dir.empty()) {
        config.temp_dir = state.temp_dir;
    }
    return state;
}

auto TransferJob::entries_for(const ProgressStore& store, Direction direction) -> infra::Result<Registry> {
    auto all = store.load();
    if (!all) {
        return std::unexpected(std::move(all.error()));
    }
    Registry out;
    for (auto& [key, state] : *all) {
        if (state.direction == direction) {
            out.emplace(key, std::move(state));
        }
    }
    return out;
}

auto TransferJob::run(const infra::CancelToken* cancel) -> infra::Result<JobReport> {
    std::lock_guard run_lock(run_mutex_);

    // Errored chunks get a fresh retry budget on every run
    for (auto& file : state_.files) {
        for (auto& chunk : file.chunks) {
            if (chunk.state == ChunkState::Errored || chunk.state == ChunkState::InProgress) {
                chunk.state = ChunkState::Waiting;
                chunk.retry_count = 0;
            }
        }
    }
    remaining_.store(state_.count_unfinished_chunks());
    last_run_cancelled_ = false;

    if (remaining_.load() == 0 && is_complete()) {
        spdlog::debug("Job {} already complete", state_.fingerprint);
        return report();
    }

    autosave_(true);
    prepare();

    std::vector<Chunk*> pending;
    std::size_t finished_before = 0;
    std::uint64_t bytes_before = 0;
    for (auto& file : state_.files) {
        for (auto& chunk : file.chunks) {
            if (chunk.state == ChunkState::Waiting && file.state == FileState::Collecting) {
                pending.push_back(&chunk);
            } else if (chunk.state == ChunkState::Finished) {
                ++finished_before;
                bytes_before += chunk.length;
            }
        }
    }

    spdlog::info("Starting {} job {}: {} file(s), {} of {} chunk(s) pending",
                 to_string(state_.direction), state_.fingerprint, state_.files.size(),
                 pending.size(), state_.total_chunks());
    if (monitor_) {
        monitor_->set_total(state_.total_chunks(), state_.total_bytes(), finished_before, bytes_before);
    }

    std::mutex failures_mutex;
    std::vector<std::pair<std::size_t, std::string>> chunk_failures;

    TransferWorkerPool pool(state_.threads, config_.retry_policy());
    auto pool_report = pool.run(
        pending,
        [this](const Chunk& chunk) { return transfer_chunk(chunk); },
        cancel,
        [&](const Chunk& chunk, const infra::Error* error) {
            if (!error) {
                remaining_.fetch_sub(1, std::memory_order_relaxed);
                if (monitor_) monitor_->chunk_finished(chunk.length);
                return;
            }
            if (monitor_) monitor_->chunk_failed();
            std::lock_guard lock(failures_mutex);
            chunk_failures.emplace_back(chunk.file_index,
                fmt::format("chunk {} at offset {}: {}", chunk.index, chunk.offset, error->message));
        });

    for (auto& [file_index, message] : chunk_failures) {
        state_.files[file_index].error = std::move(message);
    }
    last_run_cancelled_ = pool_report.cancelled;

    // Files whose chunks all landed are finished even if a cancel arrived
    // after the last chunk was dispatched
    if (!pool_report.cancelled) {
        for (std::size_t i = 0; i < state_.files.size(); ++i) {
            auto& file = state_.files[i];
            if (file.state == FileState::Done || !file.all_chunks_finished()) {
                continue;
            }
            if (auto res = finish_file(i); !res) {
                file.error = res.error().message;
            }
        }
    }

    // finish_file() may have sent files back for another pass
    remaining_.store(state_.count_unfinished_chunks());
    autosave_(!is_complete());

    auto summary = report();
    spdlog::info("{} job {}: {} finished, {} errored, {} remaining, {} file(s) pending{}",
                 to_string(state_.direction), state_.fingerprint, summary.finished_chunks,
                 summary.errored_chunks, summary.remaining_chunks, summary.pending_files,
                 summary.cancelled ? " (cancelled)" : "");
    return summary;
}

auto TransferJob::save(ProgressStore& store, bool keep) const -> infra::VoidResult {
    return store.save(state_, keep);
}

void TransferJob::autosave_(bool keep) {
    if (!store_) return;
    if (auto res = store_->save(state_, keep); !res) {
        (void)infra::log_and_return(std::move(res.error()));
    }
}

auto TransferJob::is_complete() const -> bool {
    return remaining_.load() == 0 &&
           std::all_of(state_.files.begin(), state_.files.end(),
                       [](const FileEntry& f) { return f.state == FileState::Done; });
}

auto TransferJob::report() const -> JobReport {
    JobReport out;
    out.cancelled = last_run_cancelled_;
    for (const auto& file : state_.files) {
        for (const auto& chunk : file.chunks) {
            ++out.total_chunks;
            if (chunk.state == ChunkState::Finished) ++out.finished_chunks;
            else if (chunk.state == ChunkState::Errored) ++out.errored_chunks;
        }
        if (file.state != FileState::Done && file.all_chunks_finished()) {
            ++out.pending_files;
        }
        if (file.error && file.state != FileState::Done) {
            out.failures.push_back(FileFailure{file.pair, *file.error});
        }
    }
    out.remaining_chunks = out.total_chunks - out.finished_chunks;
    return out;
}

auto TransferJob::remote_files() const -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> out;
    out.reserve(state_.files.size());
    for (const auto& file : state_.files) out.push_back(file.pair.remote);
    return out;
}

auto TransferJob::local_files() const -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> out;
    out.reserve(state_.files.size());
    for (const auto& file : state_.files) out.push_back(file.pair.local);
    return out;
}

void TransferJob::fail_file(std::size_t file_index, const infra::Error& error) {
    auto& file = state_.files[file_index];
    spdlog::error("Skipping {}: {}", file.pair.remote.string(), error.message);
    file.error = error.message;
    for (auto& chunk : file.chunks) {
        if (chunk.state != ChunkState::Finished) {
            chunk.state = ChunkState::Errored;
        }
    }
}

void TransferJob::reset_file(std::size_t file_index, std::string_view reason) {
    auto& file = state_.files[file_index];
    spdlog::warn("Restarting {}: {}", file.pair.remote.string(), reason);
    file.state = FileState::Collecting;
    file.error = std::string(reason);
    for (auto& chunk : file.chunks) {
        chunk.state = ChunkState::Waiting;
        chunk.retry_count = 0;
    }
}

void TransferJob::reject_file(std::size_t file_index, const infra::Error& error) {
    auto& file = state_.files[file_index];
    spdlog::error("{}: {}", file.pair.remote.string(), error.message);
    file.state = FileState::Collecting;
    file.error = error.message;
    for (auto& chunk : file.chunks) {
        chunk.state = ChunkState::Errored;
    }
}

auto TransferJob::remote_digest(const std::filesystem::path& path) const -> infra::Result<std::uint64_t> {
    infra::Hasher hasher;
    std::uint64_t offset = 0;
    while (true) {
        auto data = remote_.read(path, offset, io_buffer_size());
        if (!data) {
            return std::unexpected(std::move(data.error()));
        }
        if (data->empty()) break;
        hasher.update(data->data(), data->size());
        offset += data->size();
    }
    return hasher.digest();
}

auto TransferJob::contents_match(std::size_t file_index) const -> infra::Result<bool> {
    const auto& file = state_.files[file_index];
    auto remote_hash = remote_digest(file.pair.remote);
    if (!remote_hash) return std::unexpected(std::move(remote_hash.error()));
    auto local_hash = infra::hash_file(file.pair.local);
    if (!local_hash) return std::unexpected(std::move(local_hash.error()));

    if (*remote_hash != *local_hash) {
        spdlog::warn("Hash mismatch: {} ({:016x}) vs {} ({:016x})",
                     file.pair.remote.string(), *remote_hash,
                     file.pair.local.string(), *local_hash);
        return false;
    }
    return true;
}

} // namespace bxfer::core
