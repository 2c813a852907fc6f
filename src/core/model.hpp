#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../infra/error_handler/error.hpp"

namespace bxfer::core {

enum class Direction {
    Download,   // remote -> local
    Upload,     // local -> remote
};

// waiting -> in_progress -> finished
//                        -> errored -> waiting (retry)
enum class ChunkState {
    Waiting,
    InProgress,
    Finished,
    Errored,
};

// Downloads go Collecting -> Done; uploads pass through Merging while the
// staged parts are concatenated into the destination object.
enum class FileState {
    Collecting,
    Merging,
    Done,
};

[[nodiscard]] auto to_string(Direction d) -> std::string_view;
[[nodiscard]] auto to_string(ChunkState s) -> std::string_view;
[[nodiscard]] auto to_string(FileState s) -> std::string_view;

[[nodiscard]] auto direction_from_string(std::string_view s) -> infra::Result<Direction>;
[[nodiscard]] auto chunk_state_from_string(std::string_view s) -> infra::Result<ChunkState>;
[[nodiscard]] auto file_state_from_string(std::string_view s) -> infra::Result<FileState>;

struct FilePair {
    std::filesystem::path remote;
    std::filesystem::path local;

    bool operator==(const FilePair&) const = default;
};

struct Chunk {
    std::size_t file_index = 0;
    std::size_t index = 0;          // position within the file
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    ChunkState state = ChunkState::Waiting;
    int retry_count = 0;
};

struct FileEntry {
    FilePair pair;
    std::uint64_t size = 0;
    std::vector<Chunk> chunks;
    FileState state = FileState::Collecting;
    std::optional<std::string> error;   // last permanent failure, if any

    [[nodiscard]] auto all_chunks_finished() const -> bool;
};

struct JobState {
    Direction direction = Direction::Download;
    std::string source_spec;
    std::string dest_spec;

    std::uint32_t threads = 1;
    std::uint64_t chunk_size = 0;
    std::uint64_t buffer_size = 0;

    std::string job_id;       // names staged upload parts
    std::string temp_dir;     // remote directory holding staged parts

    std::vector<FileEntry> files;
    std::string fingerprint;

    [[nodiscard]] auto count_unfinished_chunks() const -> std::size_t;
    [[nodiscard]] auto total_chunks() const -> std::size_t;
    [[nodiscard]] auto total_bytes() const -> std::uint64_t;
};

// Deterministic over direction, specs, chunk size and the ordered file pairs.
// Chunk states do not take part.
[[nodiscard]] auto compute_fingerprint(const JobState& state) -> std::string;

// Remote path of the staged part for chunk `chunk_index` of file `file_index`
[[nodiscard]] auto part_path(const JobState& state, std::size_t file_index, std::size_t chunk_index)
    -> std::filesystem::path;

// Random 32-digit hex identifier
[[nodiscard]] auto generate_job_id() -> std::string;

} // namespace bxfer::core
