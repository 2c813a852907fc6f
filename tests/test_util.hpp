#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <vector>
#include "adapters/remote_store.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"

namespace bxfer::test {

// Fresh directory under the system temp dir, removed with its contents
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto operator/(const std::filesystem::path& rel) const -> std::filesystem::path {
        return path_ / rel;
    }

private:
    std::filesystem::path path_;
};

void write_file(const std::filesystem::path& path, const std::string& content);
[[nodiscard]] auto read_file(const std::filesystem::path& path) -> std::string;

// Deterministic bytes that differ between offsets, so misplaced chunks show up
[[nodiscard]] auto pattern_bytes(std::size_t size, std::uint32_t seed = 1) -> std::string;

void put_object(adapters::RemoteStore& store, const std::filesystem::path& path, const std::string& content);
[[nodiscard]] auto cat_object(const adapters::RemoteStore& store, const std::filesystem::path& path)
    -> std::string;

// bigfile (10 x 1000 bytes), littlefile and nested1/nested2/{a,b,c} of 10
// bytes each: 5 files, 10040 bytes. Returns the files in canonical order.
auto make_local_tree(const std::filesystem::path& root) -> std::vector<std::filesystem::path>;
void make_remote_tree(adapters::RemoteStore& store, const std::filesystem::path& root);

// Forwards to another store and injects failures. Counters are atomic so
// workers can hit the decorator concurrently.
class FaultyStore final : public adapters::RemoteStore {
public:
    explicit FaultyStore(adapters::RemoteStore& inner) : inner_(inner) {}

    // Next `n` reads (or writes/appends, or concats) fail with `code`
    mutable std::atomic<int> fail_reads{0};
    std::atomic<int> fail_writes{0};
    std::atomic<int> fail_concats{0};
    infra::ErrorCode fail_code = infra::ErrorCode::TransferFailure;

    // Next `n` successful reads come back with their first byte flipped
    mutable std::atomic<int> corrupt_reads{0};

    // Cancels `cancel_token` once this many reads/writes succeeded (0: never)
    infra::CancelToken* cancel_token = nullptr;
    mutable std::atomic<int> cancel_after_reads{0};
    std::atomic<int> cancel_after_writes{0};

    // Set when a write or append ever saw `watch_path` present
    std::filesystem::path watch_path;
    mutable std::atomic<bool> watch_seen{false};

    mutable std::atomic<int> reads{0};
    std::atomic<int> writes{0};
    std::atomic<int> concats{0};

    [[nodiscard]] auto exists(const std::filesystem::path& path) const -> bool override;
    [[nodiscard]] auto is_dir(const std::filesystem::path& path) const -> bool override;
    [[nodiscard]] auto list(const std::filesystem::path& dir) const
        -> infra::Result<std::vector<adapters::Entry>> override;
    [[nodiscard]] auto size(const std::filesystem::path& path) const
        -> infra::Result<std::uint64_t> override;
    [[nodiscard]] auto make_dirs(const std::filesystem::path& dir) -> infra::VoidResult override;

    [[nodiscard]] auto read(const std::filesystem::path& path, std::uint64_t offset,
                            std::uint64_t length) const -> infra::Result<std::vector<char>> override;
    [[nodiscard]] auto write(const std::filesystem::path& path, std::span<const char> data,
                             bool overwrite) -> infra::VoidResult override;
    [[nodiscard]] auto append(const std::filesystem::path& path, std::span<const char> data)
        -> infra::VoidResult override;
    [[nodiscard]] auto concat(const std::filesystem::path& target,
                              const std::vector<std::filesystem::path>& parts) -> infra::VoidResult override;
    [[nodiscard]] auto remove(const std::filesystem::path& path, bool recursive) -> infra::VoidResult override;
    [[nodiscard]] auto info(const std::filesystem::path& path) const
        -> infra::Result<adapters::ObjectInfo> override;
    [[nodiscard]] auto du(const std::filesystem::path& path, bool deep) const
        -> infra::Result<std::map<std::filesystem::path, std::uint64_t>> override;

private:
    [[nodiscard]] static auto take(std::atomic<int>& budget) -> bool;
    void check_watch() const;
    void count_towards_cancel(std::atomic<int>& done, const std::atomic<int>& limit) const;

    adapters::RemoteStore& inner_;
    mutable std::atomic<int> good_reads_{0};
    mutable std::atomic<int> good_writes_{0};
};

} // namespace bxfer::test
