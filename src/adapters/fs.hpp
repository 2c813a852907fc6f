#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "tree.hpp"
#include "../infra/error_handler/error.hpp"

namespace bxfer::adapters::fs {

enum class OpenMode {
    Read,
    Write,      // created when missing, never truncated
};

// Owning POSIX descriptor with positional I/O. Writes at distinct offsets
// from different threads need no extra locking.
class File {
public:
    File() = default;
    File(int fd, std::filesystem::path path) noexcept;
    ~File();

    File(const File&) = delete;
    File& operator=(const File&) = delete;
    File(File&& other) noexcept;
    File& operator=(File&& other) noexcept;

    [[nodiscard]] auto read_at(std::uint64_t offset, std::size_t length) const
        -> infra::Result<std::vector<char>>;
    [[nodiscard]] auto write_at(std::uint64_t offset, std::span<const char> data) const
        -> infra::VoidResult;
    [[nodiscard]] auto size() const -> infra::Result<std::uint64_t>;

    [[nodiscard]] auto is_open() const noexcept -> bool { return fd_ >= 0; }
    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }

private:
    void close_() noexcept;

    int fd_ = -1;
    std::filesystem::path path_;
};

[[nodiscard]] auto open(const std::filesystem::path& path, OpenMode mode) -> infra::Result<File>;

// Local filesystem as a Tree, plus sizing of destination files
class LocalFs final : public Tree {
public:
    [[nodiscard]] auto exists(const std::filesystem::path& path) const -> bool override;
    [[nodiscard]] auto is_dir(const std::filesystem::path& path) const -> bool override;
    [[nodiscard]] auto list(const std::filesystem::path& dir) const
        -> infra::Result<std::vector<Entry>> override;
    [[nodiscard]] auto size(const std::filesystem::path& path) const
        -> infra::Result<std::uint64_t> override;
    [[nodiscard]] auto make_dirs(const std::filesystem::path& dir) -> infra::VoidResult override;

    /// Creates `path` if needed and sets its length to exactly `length`.
    [[nodiscard]] auto resize(const std::filesystem::path& path, std::uint64_t length)
        -> infra::VoidResult;
};

} // namespace bxfer::adapters::fs
