#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "../infra/error_handler/error.hpp"

namespace bxfer::adapters {

struct Entry {
    std::string name;           // last path component
    bool is_dir = false;
    std::uint64_t size = 0;     // 0 for directories
};

// Hierarchical namespace as seen by path expansion. Implemented by both the
// remote store and the local filesystem.
class Tree {
public:
    virtual ~Tree() = default;

    [[nodiscard]] virtual auto exists(const std::filesystem::path& path) const -> bool = 0;
    [[nodiscard]] virtual auto is_dir(const std::filesystem::path& path) const -> bool = 0;

    /// Children of a directory, sorted by name.
    [[nodiscard]] virtual auto list(const std::filesystem::path& dir) const
        -> infra::Result<std::vector<Entry>> = 0;

    [[nodiscard]] virtual auto size(const std::filesystem::path& path) const
        -> infra::Result<std::uint64_t> = 0;

    /// Recursive; succeeds when the directory already exists.
    [[nodiscard]] virtual auto make_dirs(const std::filesystem::path& dir) -> infra::VoidResult = 0;
};

} // namespace bxfer::adapters
