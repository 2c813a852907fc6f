#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <cstdlib>
#include <thread>
#include <vector>

#include "config.hpp"

namespace bxfer::infra {
    void Config::merge_with(const Config& other) {
        if (other.threads) threads = other.threads;
        if (other.chunk_size) chunk_size = other.chunk_size;
        if (other.buffer_size) buffer_size = other.buffer_size;
        if (other.max_retries) max_retries = other.max_retries;
        if (other.retry_delay) retry_delay = other.retry_delay;
        if (other.temp_dir) temp_dir = other.temp_dir;
        if (other.registry_dir) registry_dir = other.registry_dir;
        if (other.verify) verify = true;
        if (other.log_level) log_level = other.log_level;
    }

    auto Config::effective_threads() const -> std::uint32_t {
        if (threads && *threads > 0) return *threads;
        const auto hw = std::thread::hardware_concurrency();
        return hw == 0 ? 1 : hw;
    }

    auto Config::effective_chunk_size() const -> std::uint64_t {
        return chunk_size.value_or(kDefaultChunkSize);
    }

    auto Config::effective_buffer_size() const -> std::uint64_t {
        return std::max<std::uint64_t>(1, buffer_size.value_or(kDefaultBufferSize));
    }

    auto Config::effective_temp_dir() const -> std::string {
        return temp_dir.value_or("/tmp");
    }

    auto Config::effective_registry_dir() const -> std::filesystem::path {
        return registry_dir.value_or(default_registry_dir());
    }

    auto Config::retry_policy() const -> RetryPolicy {
        return RetryPolicy{
            .max_attempts = max_retries.value_or(kDefaultMaxRetries),
            .initial_delay = retry_delay.value_or(kDefaultRetryDelay),
        };
    }

    auto parse_size(std::string_view text) -> std::expected<std::uint64_t, std::string> {
        std::uint64_t value = 0;
        const auto* first = text.data();
        const auto* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr == first) {
            return std::unexpected(fmt::format("Invalid size '{}'", text));
        }

        std::string suffix(ptr, last);
        std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        std::uint64_t multiplier = 1;
        if (suffix.empty() || suffix == "b") multiplier = 1;
        else if (suffix == "k" || suffix == "kb" || suffix == "kib") multiplier = 1ULL << 10;
        else if (suffix == "m" || suffix == "mb" || suffix == "mib") multiplier = 1ULL << 20;
        else if (suffix == "g" || suffix == "gb" || suffix == "gib") multiplier = 1ULL << 30;
        else {
            return std::unexpected(fmt::format("Unknown size suffix in '{}'", text));
        }
        if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
            return std::unexpected(fmt::format("Size '{}' is too large", text));
        }
        return value * multiplier;
    }

    auto default_registry_dir() -> std::filesystem::path {
        if (const char* data_home = std::getenv("XDG_DATA_HOME"); data_home && *data_home) {
            return std::filesystem::path(data_home) / "bxfer";
        }
        if (const char* home = std::getenv("HOME"); home && *home) {
            return std::filesystem::path(home) / ".local" / "share" / "bxfer";
        }
        return ".bxfer";
    }

    void configure_logging(std::string_view level) {
        spdlog::set_level(spdlog::level::from_str(std::string(level)));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        paths.push_back(".bxfer.yaml");

        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "bxfer" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "bxfer" / "config.yaml");
            }
        }

        return paths;
    }

    static auto read_size(const YAML::Node& node) -> std::expected<std::uint64_t, std::string> {
        // Plain integers and "256MiB" style strings are both accepted
        return parse_size(node.as<std::string>());
    }

    auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["threads"]) cfg.threads = config["threads"].as<std::uint32_t>();
            if (config["chunk_size"]) {
                auto size = read_size(config["chunk_size"]);
                if (!size) return std::unexpected(size.error());
                cfg.chunk_size = *size;
            }
            if (config["buffer_size"]) {
                auto size = read_size(config["buffer_size"]);
                if (!size) return std::unexpected(size.error());
                cfg.buffer_size = *size;
            }
            if (config["max_retries"]) cfg.max_retries = config["max_retries"].as<int>();
            if (config["retry_delay_ms"]) {
                cfg.retry_delay = std::chrono::milliseconds(config["retry_delay_ms"].as<long>());
            }
            if (config["temp_dir"]) cfg.temp_dir = config["temp_dir"].as<std::string>();
            if (config["registry_dir"]) cfg.registry_dir = config["registry_dir"].as<std::string>();
            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["log_level"]) {
                cfg.log_level = config["log_level"].as<std::string>();
                if (spdlog::level::from_str(*cfg.log_level) == spdlog::level::off && *cfg.log_level != "off") {
                    return std::unexpected(fmt::format("Unknown log_level '{}' in {}", *cfg.log_level, path.string()));
                }
                configure_logging(*cfg.log_level);
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return load_config(path);
        }

        // No file is not an error
        return Config{};
    }

} // namespace bxfer::infra
