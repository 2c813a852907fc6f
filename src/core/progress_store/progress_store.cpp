#include "progress_store.hpp"
#include <fstream>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <unistd.h>
#include "../../extensions/resumer.hpp"

namespace bxfer::core {

namespace {

auto key_of(const JobState& state) -> std::string {
    return state.fingerprint.empty() ? compute_fingerprint(state) : state.fingerprint;
}

auto read_registry_file(const std::filesystem::path& file) -> infra::Result<YAML::Node> {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return YAML::Node(YAML::NodeType::Map);
    }
    try {
        YAML::Node root = YAML::LoadFile(file.string());
        if (root.IsNull()) {
            return YAML::Node(YAML::NodeType::Map);
        }
        if (!root.IsMap()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::CorruptState,
                fmt::format("Registry {} is not a mapping", file.string())));
        }
        return root;
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CorruptState,
            fmt::format("Failed to parse registry {}: {}", file.string(), e.what())));
    }
}

auto write_registry_file(const std::filesystem::path& file, const YAML::Node& root) -> infra::VoidResult {
    std::error_code ec;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                fmt::format("Cannot create registry directory {}: {}", file.parent_path().string(), ec.message())));
        }
    }

    auto tmp = file;
    tmp += fmt::format(".{}.tmp", ::getpid());
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                fmt::format("Cannot write registry {}", tmp.string())));
        }
        YAML::Emitter out;
        out << root;
        ofs << out.c_str() << '\n';
        if (!ofs.flush()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Io,
                fmt::format("Failed writing registry {}", tmp.string())));
        }
    }

    std::filesystem::rename(tmp, file, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return std::unexpected(infra::make_error(infra::ErrorCode::Io,
            fmt::format("Cannot replace registry {}: {}", file.string(), ec.message())));
    }
    return {};
}

} // namespace

// =============== MemoryProgressStore ===============

auto MemoryProgressStore::save(const JobState& state, bool keep) -> infra::VoidResult {
    std::lock_guard lock(mutex_);
    const auto key = key_of(state);
    if (keep) {
        entries_.insert_or_assign(key, state);
    } else {
        entries_.erase(key);
    }
    return {};
}

auto MemoryProgressStore::load() const -> infra::Result<Registry> {
    std::lock_guard lock(mutex_);
    return entries_;
}

// =============== FileProgressStore ===============

FileProgressStore::FileProgressStore(std::filesystem::path file)
    : file_(std::move(file)) {}

auto FileProgressStore::save(const JobState& state, bool keep) -> infra::VoidResult {
    std::lock_guard lock(mutex_);

    auto root = read_registry_file(file_);
    if (!root) {
        return std::unexpected(std::move(root.error()));
    }

    const auto key = key_of(state);
    if (keep) {
        (*root)[key] = extensions::encode_job(state);
    } else {
        if (!(*root)[key]) {
            return {};
        }
        root->remove(key);
    }

    if (auto res = write_registry_file(file_, *root); !res) {
        return res;
    }
    spdlog::info("{} job {} in {}", keep ? "Saved" : "Removed", key, file_.string());
    return {};
}

auto FileProgressStore::load() const -> infra::Result<Registry> {
    std::lock_guard lock(mutex_);

    auto root = read_registry_file(file_);
    if (!root) {
        return std::unexpected(std::move(root.error()));
    }

    Registry registry;
    try {
        for (const auto& item : *root) {
            const auto key = item.first.as<std::string>();
            auto state = extensions::decode_job(item.second);
            if (!state) {
                spdlog::warn("Skipping registry entry {}: {}", key, state.error().message);
                continue;
            }
            state->fingerprint = key;
            registry.emplace(key, std::move(*state));
        }
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CorruptState,
            fmt::format("Malformed registry {}: {}", file_.string(), e.what())));
    }
    return registry;
}

auto registry_path(const infra::Config& config, Direction direction) -> std::filesystem::path {
    return config.effective_registry_dir() /
           (direction == Direction::Download ? "downloads.yaml" : "uploads.yaml");
}

} // namespace bxfer::core
