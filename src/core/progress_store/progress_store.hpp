#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include "../model.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"

namespace bxfer::core {

// fingerprint -> job
using Registry = std::map<std::string, JobState>;

// Registry of resumable jobs. Entries are replaced whole; one fingerprint
// never maps to two jobs.
class ProgressStore {
public:
    virtual ~ProgressStore() = default;

    /// keep=true writes or replaces the entry under state.fingerprint;
    /// keep=false removes it (a missing entry is not an error).
    [[nodiscard]] virtual auto save(const JobState& state, bool keep) -> infra::VoidResult = 0;

    /// Every entry currently recorded.
    [[nodiscard]] virtual auto load() const -> infra::Result<Registry> = 0;
};

class MemoryProgressStore final : public ProgressStore {
public:
    [[nodiscard]] auto save(const JobState& state, bool keep) -> infra::VoidResult override;
    [[nodiscard]] auto load() const -> infra::Result<Registry> override;

private:
    Registry entries_;
    mutable std::mutex mutex_;
};

// YAML file, re-read on every access and rewritten whole on save through a
// temporary file and rename.
class FileProgressStore final : public ProgressStore {
public:
    explicit FileProgressStore(std::filesystem::path file);

    [[nodiscard]] auto save(const JobState& state, bool keep) -> infra::VoidResult override;
    [[nodiscard]] auto load() const -> infra::Result<Registry> override;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return file_; }

private:
    std::filesystem::path file_;
    mutable std::mutex mutex_;
};

/// <registry_dir>/downloads.yaml or <registry_dir>/uploads.yaml
[[nodiscard]] auto registry_path(const infra::Config& config, Direction direction)
    -> std::filesystem::path;

} // namespace bxfer::core
