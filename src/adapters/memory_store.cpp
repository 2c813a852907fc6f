#include "memory_store.hpp"
#include <algorithm>
#include <mutex>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace bxfer::adapters {

namespace {

auto parent_of(const std::string& path) -> std::string {
    auto parent = std::filesystem::path(path).parent_path().generic_string();
    return parent.empty() ? "/" : parent;
}

} // namespace

MemoryStore::MemoryStore() {
    nodes_.emplace("/", Node{.is_dir = true, .data = {}});
}

auto MemoryStore::normalize(const std::filesystem::path& path) -> std::string {
    auto normal = path.lexically_normal().generic_string();
    if (normal == ".") normal.clear();
    if (normal.empty() || normal.front() != '/') {
        normal.insert(normal.begin(), '/');
    }
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

auto MemoryStore::child_prefix(const std::string& dir) -> std::string {
    return dir == "/" ? dir : dir + "/";
}

auto MemoryStore::ensure_dirs_locked(const std::string& dir) -> infra::VoidResult {
    std::vector<std::string> missing;
    for (auto current = dir;; current = parent_of(current)) {
        auto it = nodes_.find(current);
        if (it != nodes_.end()) {
            if (!it->second.is_dir) {
                return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                    fmt::format("Not a directory: {}", current)));
            }
            break;
        }
        missing.push_back(current);
        if (current == "/") break;
    }
    for (auto& path : missing) {
        nodes_.emplace(std::move(path), Node{.is_dir = true, .data = {}});
    }
    return {};
}

auto MemoryStore::subtree_size_locked(const std::string& dir) const -> std::uint64_t {
    const auto prefix = child_prefix(dir);
    std::uint64_t total = 0;
    for (auto it = nodes_.lower_bound(prefix); it != nodes_.end() && it->first.starts_with(prefix); ++it) {
        if (!it->second.is_dir) total += it->second.data.size();
    }
    return total;
}

auto MemoryStore::exists(const std::filesystem::path& path) const -> bool {
    std::shared_lock lock(mutex_);
    return nodes_.contains(normalize(path));
}

auto MemoryStore::is_dir(const std::filesystem::path& path) const -> bool {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(normalize(path));
    return it != nodes_.end() && it->second.is_dir;
}

auto MemoryStore::list(const std::filesystem::path& dir) const -> infra::Result<std::vector<Entry>> {
    const auto key = normalize(dir);
    std::shared_lock lock(mutex_);
    auto node = nodes_.find(key);
    if (node == nodes_.end()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("No such directory: {}", key)));
    }
    if (!node->second.is_dir) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Not a directory: {}", key)));
    }

    const auto prefix = child_prefix(key);
    std::vector<Entry> entries;
    for (auto it = nodes_.lower_bound(prefix); it != nodes_.end() && it->first.starts_with(prefix); ++it) {
        if (it->first.size() == prefix.size() ||
            it->first.find('/', prefix.size()) != std::string::npos) {
            continue; // the directory itself or a deeper descendant
        }
        entries.push_back(Entry{
            .name = it->first.substr(prefix.size()),
            .is_dir = it->second.is_dir,
            .size = it->second.is_dir ? 0 : it->second.data.size(),
        });
    }
    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b) { return a.name < b.name; });
    return entries;
}

auto MemoryStore::size(const std::filesystem::path& path) const -> infra::Result<std::uint64_t> {
    auto meta = info(path);
    if (!meta) return std::unexpected(std::move(meta.error()));
    return meta->length;
}

auto MemoryStore::make_dirs(const std::filesystem::path& dir) -> infra::VoidResult {
    std::unique_lock lock(mutex_);
    return ensure_dirs_locked(normalize(dir));
}

auto MemoryStore::read(const std::filesystem::path& path,
                       std::uint64_t offset,
                       std::uint64_t length) const -> infra::Result<std::vector<char>>
{
    const auto key = normalize(path);
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(key);
    if (it == nodes_.end()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("No such object: {}", key)));
    }
    if (it->second.is_dir) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Cannot read directory: {}", key)));
    }

    const auto& data = it->second.data;
    if (offset >= data.size()) {
        return std::vector<char>{};
    }
    const auto count = std::min<std::uint64_t>(length, data.size() - offset);
    return std::vector<char>(data.begin() + static_cast<std::ptrdiff_t>(offset),
                             data.begin() + static_cast<std::ptrdiff_t>(offset + count));
}

auto MemoryStore::write(const std::filesystem::path& path,
                        std::span<const char> data,
                        bool overwrite) -> infra::VoidResult
{
    const auto key = normalize(path);
    std::unique_lock lock(mutex_);
    if (auto it = nodes_.find(key); it != nodes_.end()) {
        if (it->second.is_dir) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                fmt::format("Cannot overwrite directory: {}", key)));
        }
        if (!overwrite) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                fmt::format("Object exists: {}", key)));
        }
    }
    if (auto res = ensure_dirs_locked(parent_of(key)); !res) {
        return res;
    }
    nodes_[key] = Node{.is_dir = false, .data = std::vector<char>(data.begin(), data.end())};
    return {};
}

auto MemoryStore::append(const std::filesystem::path& path,
                         std::span<const char> data) -> infra::VoidResult
{
    const auto key = normalize(path);
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(key);
    if (it == nodes_.end()) {
        if (auto res = ensure_dirs_locked(parent_of(key)); !res) {
            return res;
        }
        it = nodes_.emplace(key, Node{}).first;
    } else if (it->second.is_dir) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Cannot append to directory: {}", key)));
    }
    it->second.data.insert(it->second.data.end(), data.begin(), data.end());
    return {};
}

auto MemoryStore::concat(const std::filesystem::path& target,
                         const std::vector<std::filesystem::path>& parts) -> infra::VoidResult
{
    const auto key = normalize(target);
    std::unique_lock lock(mutex_);

    std::vector<char> joined;
    for (const auto& part : parts) {
        auto it = nodes_.find(normalize(part));
        if (it == nodes_.end() || it->second.is_dir) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
                fmt::format("Missing part {} for {}", part.generic_string(), key)));
        }
        joined.insert(joined.end(), it->second.data.begin(), it->second.data.end());
    }

    if (auto it = nodes_.find(key); it != nodes_.end() && it->second.is_dir) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Concat target is a directory: {}", key)));
    }
    if (auto res = ensure_dirs_locked(parent_of(key)); !res) {
        return res;
    }
    // Published in one step under the exclusive lock
    nodes_[key] = Node{.is_dir = false, .data = std::move(joined)};
    spdlog::debug("Concatenated {} parts into {}", parts.size(), key);
    return {};
}

auto MemoryStore::remove(const std::filesystem::path& path, bool recursive) -> infra::VoidResult {
    const auto key = normalize(path);
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(key);
    if (it == nodes_.end()) {
        return {};
    }

    if (it->second.is_dir) {
        const auto prefix = child_prefix(key);
        auto first = nodes_.lower_bound(prefix);
        auto last = first;
        while (last != nodes_.end() && last->first.starts_with(prefix)) ++last;
        if (first != last && !recursive) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                fmt::format("Directory not empty: {}", key)));
        }
        nodes_.erase(first, last);
        if (key == "/") {
            return {}; // the root itself stays
        }
    }
    nodes_.erase(it);
    return {};
}

auto MemoryStore::info(const std::filesystem::path& path) const -> infra::Result<ObjectInfo> {
    const auto key = normalize(path);
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(key);
    if (it == nodes_.end()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("No such path: {}", key)));
    }
    return ObjectInfo{
        .name = key,
        .length = it->second.is_dir ? 0 : it->second.data.size(),
        .is_dir = it->second.is_dir,
    };
}

auto MemoryStore::du(const std::filesystem::path& path, bool deep) const
    -> infra::Result<std::map<std::filesystem::path, std::uint64_t>>
{
    const auto key = normalize(path);
    std::shared_lock lock(mutex_);
    auto node = nodes_.find(key);
    if (node == nodes_.end()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("No such path: {}", key)));
    }

    std::map<std::filesystem::path, std::uint64_t> usage;
    if (!node->second.is_dir) {
        usage.emplace(key, node->second.data.size());
        return usage;
    }

    const auto prefix = child_prefix(key);
    for (auto it = nodes_.lower_bound(prefix); it != nodes_.end() && it->first.starts_with(prefix); ++it) {
        const bool direct = it->first.find('/', prefix.size()) == std::string::npos;
        if (deep) {
            if (!it->second.is_dir) usage.emplace(it->first, it->second.data.size());
        } else if (direct && it->first.size() > prefix.size()) {
            usage.emplace(it->first, it->second.is_dir ? subtree_size_locked(it->first)
                                                       : it->second.data.size());
        }
    }
    return usage;
}

} // namespace bxfer::adapters
