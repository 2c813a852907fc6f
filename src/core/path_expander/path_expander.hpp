#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "../../adapters/tree.hpp"
#include "../../infra/error_handler/error.hpp"

namespace bxfer::core {

struct ExpandedFile {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::uint64_t size = 0;
};

/// Resolves a source spec against the source namespace and maps every match
/// into the destination namespace.
///
///   - a single file goes to `dest`, or to `dest/<name>` when `dest` is an
///     existing directory;
///   - a directory is walked depth-first and mirrored below `dest`;
///   - a spec with wildcards (`*`, `?`, `[...]`) is matched one path segment
///     at a time; directories matched by the last segment are walked.
///
/// Results are ordered by path relative to the spec's non-wildcard prefix,
/// compared segment by segment. An empty result is a NotFound error.
class PathExpander {
public:
    PathExpander(const adapters::Tree& source, const adapters::Tree& destination);

    [[nodiscard]] auto expand(const std::filesystem::path& spec,
                              const std::filesystem::path& dest) const
        -> infra::Result<std::vector<ExpandedFile>>;

    [[nodiscard]] static auto has_wildcard(std::string_view segment) -> bool;

private:
    struct Match {
        std::filesystem::path path;
        std::uint64_t size = 0;
    };

    auto walk(const std::filesystem::path& dir, std::vector<Match>& out) const -> infra::VoidResult;
    auto glob(const std::filesystem::path& current,
              const std::vector<std::string>& segments,
              std::size_t depth,
              std::vector<Match>& out) const -> infra::VoidResult;

    const adapters::Tree& source_;
    const adapters::Tree& destination_;
};

} // namespace bxfer::core
