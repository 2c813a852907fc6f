#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include "remote_store.hpp"

namespace bxfer::adapters {

// In-process RemoteStore. Paths are absolute POSIX paths; relative paths are
// taken from the root. Writes create missing parent directories.
class MemoryStore final : public RemoteStore {
public:
    MemoryStore();
    ~MemoryStore() override = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    [[nodiscard]] auto exists(const std::filesystem::path& path) const -> bool override;
    [[nodiscard]] auto is_dir(const std::filesystem::path& path) const -> bool override;
    [[nodiscard]] auto list(const std::filesystem::path& dir) const
        -> infra::Result<std::vector<Entry>> override;
    [[nodiscard]] auto size(const std::filesystem::path& path) const
        -> infra::Result<std::uint64_t> override;
    [[nodiscard]] auto make_dirs(const std::filesystem::path& dir) -> infra::VoidResult override;

    [[nodiscard]] auto read(const std::filesystem::path& path,
                            std::uint64_t offset,
                            std::uint64_t length) const
        -> infra::Result<std::vector<char>> override;
    [[nodiscard]] auto write(const std::filesystem::path& path,
                             std::span<const char> data,
                             bool overwrite) -> infra::VoidResult override;
    [[nodiscard]] auto append(const std::filesystem::path& path,
                              std::span<const char> data) -> infra::VoidResult override;
    [[nodiscard]] auto concat(const std::filesystem::path& target,
                              const std::vector<std::filesystem::path>& parts)
        -> infra::VoidResult override;
    [[nodiscard]] auto remove(const std::filesystem::path& path, bool recursive)
        -> infra::VoidResult override;
    [[nodiscard]] auto info(const std::filesystem::path& path) const
        -> infra::Result<ObjectInfo> override;
    [[nodiscard]] auto du(const std::filesystem::path& path, bool deep) const
        -> infra::Result<std::map<std::filesystem::path, std::uint64_t>> override;

private:
    struct Node {
        bool is_dir = false;
        std::vector<char> data;
    };

    static auto normalize(const std::filesystem::path& path) -> std::string;
    static auto child_prefix(const std::string& dir) -> std::string;

    // Callers hold mutex_ exclusively
    auto ensure_dirs_locked(const std::string& dir) -> infra::VoidResult;
    auto subtree_size_locked(const std::string& dir) const -> std::uint64_t;

    std::map<std::string, Node> nodes_;
    mutable std::shared_mutex mutex_;
};

} // namespace bxfer::adapters
