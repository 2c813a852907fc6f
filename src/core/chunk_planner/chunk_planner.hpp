#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include "../model.hpp"

namespace bxfer::core {

struct ByteRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    bool operator==(const ByteRange&) const = default;
};

/// Splits [0, file_size) into ceil(file_size / chunk_size) contiguous ranges.
/// Every range holds chunk_size bytes except possibly the last. An empty
/// file yields a single empty range so it is still created at the
/// destination. A chunk_size of 0 means "whole file in one range".
[[nodiscard]] auto plan_ranges(std::uint64_t file_size, std::uint64_t chunk_size)
    -> std::vector<ByteRange>;

/// plan_ranges() materialised as waiting chunks of file `file_index`.
[[nodiscard]] auto plan_chunks(std::size_t file_index, std::uint64_t file_size,
                               std::uint64_t chunk_size) -> std::vector<Chunk>;

} // namespace bxfer::core
