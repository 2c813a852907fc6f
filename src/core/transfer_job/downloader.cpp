#include "transfer_job.hpp"
#include <algorithm>
#include <memory>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace bxfer::core {

auto Downloader::create(adapters::RemoteStore& remote,
                        adapters::fs::LocalFs& local,
                        const TransferRequest& request) -> infra::Result<std::unique_ptr<Downloader>>
{
    auto state = plan(Direction::Download, request, remote, local);
    if (!state) {
        return std::unexpected(std::move(state.error()));
    }

    auto job = std::make_unique<Downloader>(Key{}, std::move(*state), remote, local, request.config,
                                                request.progress_store, request.monitor);
    if (request.run) {
        if (auto res = job->run(request.cancel); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }
    return job;
}

auto Downloader::from_state(JobState state,
                            adapters::RemoteStore& remote,
                            adapters::fs::LocalFs& local,
                            infra::Config config,
                            ProgressStore* store,
                            infra::ProgressMonitor* monitor) -> infra::Result<std::unique_ptr<Downloader>>
{
    auto adopted = adopt(std::move(state), Direction::Download, config);
    if (!adopted) {
        return std::unexpected(std::move(adopted.error()));
    }
    return std::make_unique<Downloader>(Key{}, std::move(*adopted), remote, local, std::move(config),
                                         store, monitor);
}

auto Downloader::load(const ProgressStore& store) -> infra::Result<Registry> {
    return entries_for(store, Direction::Download);
}

void Downloader::prepare() {
    for (std::size_t i = 0; i < state_.files.size(); ++i) {
        auto& file = state_.files[i];
        if (file.state == FileState::Done) {
            continue;
        }

        // Finished chunks only count if the bytes they wrote are still there
        const bool resumed = std::any_of(file.chunks.begin(), file.chunks.end(),
            [](const Chunk& c) { return c.state == ChunkState::Finished; });
        if (resumed) {
            auto current = local_.size(file.pair.local);
            if (!current || *current != file.size) {
                reset_file(i, fmt::format("local copy {} is missing or has the wrong size",
                                          file.pair.local.string()));
            }
        }

        if (file.pair.local.has_parent_path()) {
            if (auto res = local_.make_dirs(file.pair.local.parent_path()); !res) {
                fail_file(i, res.error());
                continue;
            }
        }
        if (auto res = local_.resize(file.pair.local, file.size); !res) {
            fail_file(i, res.error());
        }
    }
}

auto Downloader::transfer_chunk(const Chunk& chunk) -> infra::VoidResult {
    const auto& file = state_.files[chunk.file_index];

    auto out = adapters::fs::open(file.pair.local, adapters::fs::OpenMode::Write);
    if (!out) {
        return std::unexpected(std::move(out.error()));
    }

    std::uint64_t done = 0;
    while (done < chunk.length) {
        const auto want = std::min(io_buffer_size(), chunk.length - done);
        auto data = remote_.read(file.pair.remote, chunk.offset + done, want);
        if (!data) {
            return std::unexpected(std::move(data.error()));
        }
        if (data->empty()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::TransferFailure,
                fmt::format("{} ended at {}, expected {} bytes",
                            file.pair.remote.string(), chunk.offset + done, file.size)));
        }
        if (auto res = out->write_at(chunk.offset + done, *data); !res) {
            return res;
        }
        done += data->size();
    }

    spdlog::debug("Downloaded {} [{}, {})", file.pair.remote.string(),
                  chunk.offset, chunk.offset + chunk.length);
    return {};
}

auto Downloader::finish_file(std::size_t file_index) -> infra::VoidResult {
    auto& file = state_.files[file_index];

    if (config_.verify) {
        auto match = contents_match(file_index);
        if (!match) {
            return std::unexpected(std::move(match.error()));
        }
        if (!*match) {
            reject_file(file_index, infra::make_error(infra::ErrorCode::ChecksumMismatch,
                fmt::format("{} differs from {} after download",
                            file.pair.local.string(), file.pair.remote.string())));
            return {};
        }
    }

    file.state = FileState::Done;
    file.error.reset();
    spdlog::debug("Completed {}", file.pair.local.string());
    return {};
}

} // namespace bxfer::core
