#include "model.hpp"
#include <algorithm>
#include <random>
#include <fmt/core.h>
#include "../infra/hash/hasher.hpp"

namespace bxfer::core {

auto to_string(Direction d) -> std::string_view {
    return d == Direction::Download ? "download" : "upload";
}

auto to_string(ChunkState s) -> std::string_view {
    switch (s) {
        case ChunkState::Waiting:    return "waiting";
        case ChunkState::InProgress: return "in_progress";
        case ChunkState::Finished:   return "finished";
        case ChunkState::Errored:    return "errored";
    }
    return "waiting";
}

auto to_string(FileState s) -> std::string_view {
    switch (s) {
        case FileState::Collecting: return "collecting";
        case FileState::Merging:    return "merging";
        case FileState::Done:       return "done";
    }
    return "collecting";
}

auto direction_from_string(std::string_view s) -> infra::Result<Direction> {
    if (s == "download") return Direction::Download;
    if (s == "upload") return Direction::Upload;
    return std::unexpected(infra::make_error(infra::ErrorCode::CorruptState,
                                             fmt::format("Unknown direction '{}'", s)));
}

auto chunk_state_from_string(std::string_view s) -> infra::Result<ChunkState> {
    if (s == "waiting") return ChunkState::Waiting;
    if (s == "in_progress") return ChunkState::InProgress;
    if (s == "finished") return ChunkState::Finished;
    if (s == "errored") return ChunkState::Errored;
    return std::unexpected(infra::make_error(infra::ErrorCode::CorruptState,
                                             fmt::format("Unknown chunk state '{}'", s)));
}

auto file_state_from_string(std::string_view s) -> infra::Result<FileState> {
    if (s == "collecting") return FileState::Collecting;
    if (s == "merging") return FileState::Merging;
    if (s == "done") return FileState::Done;
    return std::unexpected(infra::make_error(infra::ErrorCode::CorruptState,
                                             fmt::format("Unknown file state '{}'", s)));
}

auto FileEntry::all_chunks_finished() const -> bool {
    return std::all_of(chunks.begin(), chunks.end(),
                       [](const Chunk& c) { return c.state == ChunkState::Finished; });
}

auto JobState::count_unfinished_chunks() const -> std::size_t {
    std::size_t n = 0;
    for (const auto& file : files) {
        n += static_cast<std::size_t>(std::count_if(file.chunks.begin(), file.chunks.end(),
            [](const Chunk& c) { return c.state != ChunkState::Finished; }));
    }
    return n;
}

auto JobState::total_chunks() const -> std::size_t {
    std::size_t n = 0;
    for (const auto& file : files) {
        n += file.chunks.size();
    }
    return n;
}

auto JobState::total_bytes() const -> std::uint64_t {
    std::uint64_t n = 0;
    for (const auto& file : files) {
        n += file.size;
    }
    return n;
}

auto compute_fingerprint(const JobState& state) -> std::string {
    infra::Hasher hasher;
    hasher.update_field(to_string(state.direction));
    hasher.update_field(state.source_spec);
    hasher.update_field(state.dest_spec);
    hasher.update_field(state.chunk_size);
    hasher.update_field(static_cast<std::uint64_t>(state.files.size()));
    for (const auto& file : state.files) {
        hasher.update_field(file.pair.remote.generic_string());
        hasher.update_field(file.pair.local.generic_string());
    }
    return hasher.hex_digest();
}

auto part_path(const JobState& state, std::size_t file_index, std::size_t chunk_index)
    -> std::filesystem::path
{
    return std::filesystem::path(state.temp_dir) /
           fmt::format("{}_{}_{}", state.job_id, file_index, chunk_index);
}

auto generate_job_id() -> std::string {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    return fmt::format("{:016x}{:016x}", rng(), rng());
}

} // namespace bxfer::core
