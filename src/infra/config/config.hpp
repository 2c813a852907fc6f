#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>
#include <chrono>
#include <expected>
#include <filesystem>
#include "../retry.hpp"

namespace bxfer::infra {

inline constexpr std::uint64_t kDefaultChunkSize = 256ULL * 1024 * 1024;  // 256 MiB
inline constexpr std::uint64_t kDefaultBufferSize = 4ULL * 1024 * 1024;   // 4 MiB
inline constexpr int kDefaultMaxRetries = 5;
inline constexpr std::chrono::milliseconds kDefaultRetryDelay{100};

struct Config {
    // Transfer shape
    std::optional<std::uint32_t> threads;
    std::optional<std::uint64_t> chunk_size;    // bytes
    std::optional<std::uint64_t> buffer_size;   // bytes

    // Retry
    std::optional<int> max_retries;
    std::optional<std::chrono::milliseconds> retry_delay;

    // Locations
    std::optional<std::string> temp_dir;                   // remote staging for upload parts
    std::optional<std::filesystem::path> registry_dir;     // resume registries

    // Behavior
    bool verify = false;
    std::optional<std::string> log_level;

    void merge_with(const Config& other);

    [[nodiscard]] auto effective_threads() const -> std::uint32_t;
    [[nodiscard]] auto effective_chunk_size() const -> std::uint64_t;
    [[nodiscard]] auto effective_buffer_size() const -> std::uint64_t;
    [[nodiscard]] auto effective_temp_dir() const -> std::string;
    [[nodiscard]] auto effective_registry_dir() const -> std::filesystem::path;
    [[nodiscard]] auto retry_policy() const -> RetryPolicy;
};

/// Loads configuration from YAML.
/// Looks for the file in this order:
///   1. ./.bxfer.yaml
///   2. $XDG_CONFIG_HOME/bxfer/config.yaml or ~/.config/bxfer/config.yaml
/// Returns a default Config when no file exists.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Parses one explicit YAML file. A `log_level` key is applied to spdlog
/// through configure_logging() as soon as the file is read.
[[nodiscard]] auto load_config(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// "4194304", "4MiB", "4M", "1G", "512k" -> bytes
[[nodiscard]] auto parse_size(std::string_view text) -> std::expected<std::uint64_t, std::string>;

/// Per-user directory for resume registries.
[[nodiscard]] auto default_registry_dir() -> std::filesystem::path;

/// Applies `level` ("trace".."off") and the standard log pattern to spdlog.
void configure_logging(std::string_view level = "info");

} // namespace bxfer::infra
