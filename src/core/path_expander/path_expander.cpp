#include "path_expander.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <fnmatch.h>

namespace bxfer::core {

PathExpander::PathExpander(const adapters::Tree& source, const adapters::Tree& destination)
    : source_(source), destination_(destination) {}

auto PathExpander::has_wildcard(std::string_view segment) -> bool {
    return segment.find_first_of("*?[") != std::string_view::npos;
}

auto PathExpander::expand(const std::filesystem::path& spec,
                          const std::filesystem::path& dest) const
    -> infra::Result<std::vector<ExpandedFile>>
{
    const auto normal = spec.lexically_normal();

    std::filesystem::path prefix;
    std::vector<std::string> pattern;
    for (const auto& part : normal) {
        const auto text = part.string();
        if (text.empty()) continue; // trailing separator
        if (pattern.empty() && !has_wildcard(text)) {
            prefix /= part;
        } else {
            pattern.push_back(text);
        }
    }
    if (prefix.empty()) {
        prefix = ".";
    }

    std::vector<Match> matches;
    std::filesystem::path base;

    if (pattern.empty()) {
        if (!source_.exists(normal)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
                fmt::format("Source not found: {}", spec.string())));
        }
        if (!source_.is_dir(normal)) {
            auto bytes = source_.size(normal);
            if (!bytes) return std::unexpected(std::move(bytes.error()));
            auto target = destination_.is_dir(dest) ? dest / normal.filename() : dest;
            return std::vector<ExpandedFile>{{normal, target, *bytes}};
        }
        if (auto res = walk(normal, matches); !res) {
            return std::unexpected(std::move(res.error()));
        }
        base = normal;
    } else {
        if (auto res = glob(prefix, pattern, 0, matches); !res) {
            return std::unexpected(std::move(res.error()));
        }
        base = prefix.lexically_normal();
    }

    if (matches.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("No files match {}", spec.string())));
    }

    // Canonical order: relative path, segment by segment. Fingerprints depend on it.
    std::vector<std::pair<std::filesystem::path, Match>> ordered;
    ordered.reserve(matches.size());
    for (auto& match : matches) {
        auto rel = match.path.lexically_relative(base);
        if (rel.empty() || rel == ".") {
            rel = match.path.filename();
        }
        ordered.emplace_back(std::move(rel), std::move(match));
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<ExpandedFile> files;
    files.reserve(ordered.size());
    for (auto& [rel, match] : ordered) {
        files.push_back(ExpandedFile{
            .source = std::move(match.path),
            .destination = (dest / rel).lexically_normal(),
            .size = match.size,
        });
    }
    spdlog::debug("Expanded {} into {} file(s)", spec.string(), files.size());
    return files;
}

auto PathExpander::walk(const std::filesystem::path& dir, std::vector<Match>& out) const
    -> infra::VoidResult
{
    auto entries = source_.list(dir);
    if (!entries) {
        return std::unexpected(std::move(entries.error()));
    }
    for (const auto& entry : *entries) {
        auto child = (dir / entry.name).lexically_normal();
        if (entry.is_dir) {
            if (auto res = walk(child, out); !res) return res;
        } else {
            out.push_back(Match{std::move(child), entry.size});
        }
    }
    return {};
}

auto PathExpander::glob(const std::filesystem::path& current,
                        const std::vector<std::string>& segments,
                        std::size_t depth,
                        std::vector<Match>& out) const -> infra::VoidResult
{
    const auto& segment = segments[depth];
    const bool last = depth + 1 == segments.size();

    auto visit = [&](const std::filesystem::path& path, bool is_dir, std::uint64_t bytes)
        -> infra::VoidResult
    {
        if (last) {
            if (is_dir) return walk(path, out);
            out.push_back(Match{path, bytes});
            return {};
        }
        if (is_dir) return glob(path, segments, depth + 1, out);
        return {};
    };

    if (!has_wildcard(segment)) {
        auto next = (current / segment).lexically_normal();
        if (!source_.exists(next)) {
            return {};
        }
        const bool is_dir = source_.is_dir(next);
        std::uint64_t bytes = 0;
        if (!is_dir) {
            auto size = source_.size(next);
            if (!size) return std::unexpected(std::move(size.error()));
            bytes = *size;
        }
        return visit(next, is_dir, bytes);
    }

    auto entries = source_.list(current);
    if (!entries) {
        if (entries.error().code == infra::ErrorCode::NotFound) {
            return {};
        }
        return std::unexpected(std::move(entries.error()));
    }
    for (const auto& entry : *entries) {
        if (::fnmatch(segment.c_str(), entry.name.c_str(), 0) != 0) {
            continue;
        }
        if (auto res = visit((current / entry.name).lexically_normal(), entry.is_dir, entry.size); !res) {
            return res;
        }
    }
    return {};
}

} // namespace bxfer::core
