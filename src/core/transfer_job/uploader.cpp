#include "transfer_job.hpp"
#include <algorithm>
#include <memory>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../infra/retry.hpp"

namespace bxfer::core {

auto Uploader::create(adapters::RemoteStore& remote,
                      adapters::fs::LocalFs& local,
                      const TransferRequest& request) -> infra::Result<std::unique_ptr<Uploader>>
{
    auto state = plan(Direction::Upload, request, local, remote);
    if (!state) {
        return std::unexpected(std::move(state.error()));
    }

    auto job = std::make_unique<Uploader>(Key{}, std::move(*state), remote, local, request.config,
                                              request.progress_store, request.monitor);
    if (request.run) {
        if (auto res = job->run(request.cancel); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }
    return job;
}

auto Uploader::from_state(JobState state,
                          adapters::RemoteStore& remote,
                          adapters::fs::LocalFs& local,
                          infra::Config config,
                          ProgressStore* store,
                          infra::ProgressMonitor* monitor) -> infra::Result<std::unique_ptr<Uploader>>
{
    auto adopted = adopt(std::move(state), Direction::Upload, config);
    if (!adopted) {
        return std::unexpected(std::move(adopted.error()));
    }
    return std::make_unique<Uploader>(Key{}, std::move(*adopted), remote, local, std::move(config),
                                       store, monitor);
}

auto Uploader::load(const ProgressStore& store) -> infra::Result<Registry> {
    return entries_for(store, Direction::Upload);
}

auto Uploader::part_paths(std::size_t file_index) const -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> parts;
    const auto& file = state_.files.at(file_index);
    parts.reserve(file.chunks.size());
    for (const auto& chunk : file.chunks) {
        parts.push_back(part_path(state_, file_index, chunk.index));
    }
    return parts;
}

void Uploader::prepare() {
    auto staging = remote_.make_dirs(state_.temp_dir);

    for (std::size_t i = 0; i < state_.files.size(); ++i) {
        auto& file = state_.files[i];
        if (file.state == FileState::Done) {
            continue;
        }
        if (!staging) {
            fail_file(i, staging.error());
            continue;
        }

        // A finished chunk whose part vanished from staging is uploaded again
        if (file.state == FileState::Collecting) {
            for (auto& chunk : file.chunks) {
                if (chunk.state == ChunkState::Finished &&
                    !remote_.exists(part_path(state_, i, chunk.index))) {
                    spdlog::warn("Part {} of {} is gone, uploading it again",
                                 chunk.index, file.pair.local.string());
                    chunk.state = ChunkState::Waiting;
                    chunk.retry_count = 0;
                }
            }
        }

        const auto parent = file.pair.remote.parent_path();
        if (!parent.empty()) {
            if (auto res = remote_.make_dirs(parent); !res) {
                fail_file(i, res.error());
            }
        }
    }
}

auto Uploader::transfer_chunk(const Chunk& chunk) -> infra::VoidResult {
    const auto& file = state_.files[chunk.file_index];
    const auto part = part_path(state_, chunk.file_index, chunk.index);

    auto in = adapters::fs::open(file.pair.local, adapters::fs::OpenMode::Read);
    if (!in) {
        return std::unexpected(std::move(in.error()));
    }

    if (chunk.length == 0) {
        return remote_.write(part, {}, true);
    }

    std::uint64_t done = 0;
    while (done < chunk.length) {
        const auto want = std::min(io_buffer_size(), chunk.length - done);
        auto data = in->read_at(chunk.offset + done, static_cast<std::size_t>(want));
        if (!data) {
            return std::unexpected(std::move(data.error()));
        }
        if (data->empty()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::TransferFailure,
                fmt::format("{} ended at {}, expected {} bytes",
                            file.pair.local.string(), chunk.offset + done, file.size)));
        }
        // A retried chunk starts its part over
        auto res = done == 0 ? remote_.write(part, *data, true)
                             : remote_.append(part, *data);
        if (!res) {
            return res;
        }
        done += data->size();
    }

    spdlog::debug("Uploaded {} [{}, {}) to {}", file.pair.local.string(),
                  chunk.offset, chunk.offset + chunk.length, part.string());
    return {};
}

auto Uploader::finish_file(std::size_t file_index) -> infra::VoidResult {
    auto& file = state_.files[file_index];
    const auto parts = part_paths(file_index);

    if (file.state == FileState::Collecting) {
        file.state = FileState::Merging;
    }

    std::size_t missing = 0;
    for (auto& chunk : file.chunks) {
        if (!remote_.exists(parts[chunk.index])) {
            chunk.state = ChunkState::Waiting;
            chunk.retry_count = 0;
            ++missing;
        }
    }
    if (missing > 0) {
        spdlog::warn("{} of {} part(s) of {} are gone, uploading them again",
                     missing, parts.size(), file.pair.local.string());
        file.state = FileState::Collecting;
        return {};
    }

    auto merged = infra::with_retry([&]() {
        return remote_.concat(file.pair.remote, parts);
    }, config_.retry_policy());
    if (!merged) {
        // Parts stay staged; the next run repeats only the merge
        return std::unexpected(infra::log_and_return(infra::make_error(infra::ErrorCode::MergeFailure,
            fmt::format("Merging {} part(s) into {} failed: {}",
                        parts.size(), file.pair.remote.string(), merged.error().message))));
    }

    if (config_.verify) {
        auto match = contents_match(file_index);
        if (!match) {
            return std::unexpected(std::move(match.error()));
        }
        if (!*match) {
            reject_file(file_index, infra::make_error(infra::ErrorCode::ChecksumMismatch,
                fmt::format("{} differs from {} after upload",
                            file.pair.remote.string(), file.pair.local.string())));
            return {};
        }
    }

    for (const auto& part : parts) {
        if (auto res = remote_.remove(part, false); !res) {
            spdlog::warn("Could not remove part {}: {}", part.string(), res.error().message);
        }
    }

    file.state = FileState::Done;
    file.error.reset();
    spdlog::debug("Merged {} part(s) into {}", parts.size(), file.pair.remote.string());
    return {};
}

} // namespace bxfer::core
