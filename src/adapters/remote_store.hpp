#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <span>
#include <vector>
#include "tree.hpp"

namespace bxfer::adapters {

struct ObjectInfo {
    std::filesystem::path name;
    std::uint64_t length = 0;
    bool is_dir = false;
};

// Primitive operations of the remote hierarchical object store.
class RemoteStore : public Tree {
public:
    /// Up to `length` bytes starting at `offset`; shorter only at end of object.
    [[nodiscard]] virtual auto read(const std::filesystem::path& path,
                                    std::uint64_t offset,
                                    std::uint64_t length) const
        -> infra::Result<std::vector<char>> = 0;

    /// Creates (or with `overwrite`, replaces) an object holding `data`.
    [[nodiscard]] virtual auto write(const std::filesystem::path& path,
                                     std::span<const char> data,
                                     bool overwrite) -> infra::VoidResult = 0;

    [[nodiscard]] virtual auto append(const std::filesystem::path& path,
                                      std::span<const char> data) -> infra::VoidResult = 0;

    /// Publishes `target` as the concatenation of `parts`, in order. Readers
    /// observe either no `target` (or its previous content) or the complete
    /// result. `parts` are left in place.
    [[nodiscard]] virtual auto concat(const std::filesystem::path& target,
                                      const std::vector<std::filesystem::path>& parts)
        -> infra::VoidResult = 0;

    /// Removing a missing path is not an error.
    [[nodiscard]] virtual auto remove(const std::filesystem::path& path, bool recursive)
        -> infra::VoidResult = 0;

    [[nodiscard]] virtual auto info(const std::filesystem::path& path) const
        -> infra::Result<ObjectInfo> = 0;

    /// Usage per path. With `deep`, every file below `path`; otherwise the
    /// direct children, directories reporting their aggregate size.
    [[nodiscard]] virtual auto du(const std::filesystem::path& path, bool deep) const
        -> infra::Result<std::map<std::filesystem::path, std::uint64_t>> = 0;

    [[nodiscard]] auto du_total(const std::filesystem::path& path, bool deep) const
        -> infra::Result<std::uint64_t>
    {
        auto usage = du(path, deep);
        if (!usage) return std::unexpected(std::move(usage.error()));
        std::uint64_t total = 0;
        for (const auto& [_, bytes] : *usage) total += bytes;
        return total;
    }
};

} // namespace bxfer::adapters
