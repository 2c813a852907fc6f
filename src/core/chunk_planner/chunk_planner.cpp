#include "chunk_planner.hpp"
#include <algorithm>

namespace bxfer::core {

auto plan_ranges(std::uint64_t file_size, std::uint64_t chunk_size) -> std::vector<ByteRange> {
    if (file_size == 0) {
        return {ByteRange{0, 0}};
    }
    if (chunk_size == 0 || chunk_size >= file_size) {
        return {ByteRange{0, file_size}};
    }

    const std::uint64_t count = (file_size + chunk_size - 1) / chunk_size;
    std::vector<ByteRange> ranges;
    ranges.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t offset = 0; offset < file_size; offset += chunk_size) {
        ranges.push_back({offset, std::min(chunk_size, file_size - offset)});
    }
    return ranges;
}

auto plan_chunks(std::size_t file_index, std::uint64_t file_size, std::uint64_t chunk_size)
    -> std::vector<Chunk>
{
    const auto ranges = plan_ranges(file_size, chunk_size);
    std::vector<Chunk> chunks;
    chunks.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        chunks.push_back(Chunk{
            .file_index = file_index,
            .index = i,
            .offset = ranges[i].offset,
            .length = ranges[i].length,
        });
    }
    return chunks;
}

} // namespace bxfer::core
