#include "test_util.hpp"
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <stdlib.h>

namespace bxfer::test {

TempDir::TempDir() {
    auto pattern = (std::filesystem::temp_directory_path() / "bxfer-test-XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = pattern;
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

auto pattern_bytes(std::size_t size, std::uint32_t seed) -> std::string {
    std::string out(size, '\0');
    std::uint32_t x = seed * 2654435761u + 1;
    for (auto& c : out) {
        x = x * 1664525u + 1013904223u;
        c = static_cast<char>(x >> 24);
    }
    return out;
}

void put_object(adapters::RemoteStore& store, const std::filesystem::path& path, const std::string& content) {
    auto res = store.write(path, std::span<const char>(content.data(), content.size()), true);
    if (!res) {
        throw std::runtime_error(res.error().message);
    }
}

auto cat_object(const adapters::RemoteStore& store, const std::filesystem::path& path) -> std::string {
    auto length = store.size(path);
    if (!length) {
        throw std::runtime_error(length.error().message);
    }
    auto data = store.read(path, 0, *length);
    if (!data) {
        throw std::runtime_error(data.error().message);
    }
    return std::string(data->begin(), data->end());
}

namespace {

auto bigfile_content() -> std::string {
    std::string content;
    for (char digit = '0'; digit <= '9'; ++digit) {
        content.append(1000, digit);
    }
    return content;
}

} // namespace

auto make_local_tree(const std::filesystem::path& root) -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> files{
        root / "bigfile",
        root / "littlefile",
        root / "nested1" / "nested2" / "a",
        root / "nested1" / "nested2" / "b",
        root / "nested1" / "nested2" / "c",
    };
    write_file(files[0], bigfile_content());
    for (std::size_t i = 1; i < files.size(); ++i) {
        write_file(files[i], "0123456789");
    }
    return files;
}

void make_remote_tree(adapters::RemoteStore& store, const std::filesystem::path& root) {
    put_object(store, root / "bigfile", bigfile_content());
    put_object(store, root / "littlefile", "0123456789");
    for (const char* name : {"a", "b", "c"}) {
        put_object(store, root / "nested1" / "nested2" / name, "0123456789");
    }
}

// =============== FaultyStore ===============

auto FaultyStore::take(std::atomic<int>& budget) -> bool {
    int left = budget.load();
    while (left > 0) {
        if (budget.compare_exchange_weak(left, left - 1)) {
            return true;
        }
    }
    return false;
}

void FaultyStore::check_watch() const {
    if (!watch_path.empty() && inner_.exists(watch_path)) {
        watch_seen = true;
    }
}

void FaultyStore::count_towards_cancel(std::atomic<int>& done, const std::atomic<int>& limit) const {
    const int n = ++done;
    if (cancel_token && limit.load() > 0 && n >= limit.load()) {
        cancel_token->cancel();
    }
}

auto FaultyStore::exists(const std::filesystem::path& path) const -> bool { return inner_.exists(path); }
auto FaultyStore::is_dir(const std::filesystem::path& path) const -> bool { return inner_.is_dir(path); }

auto FaultyStore::list(const std::filesystem::path& dir) const -> infra::Result<std::vector<adapters::Entry>> {
    return inner_.list(dir);
}

auto FaultyStore::size(const std::filesystem::path& path) const -> infra::Result<std::uint64_t> {
    return inner_.size(path);
}

auto FaultyStore::make_dirs(const std::filesystem::path& dir) -> infra::VoidResult {
    return inner_.make_dirs(dir);
}

auto FaultyStore::read(const std::filesystem::path& path, std::uint64_t offset,
                       std::uint64_t length) const -> infra::Result<std::vector<char>>
{
    ++reads;
    if (take(fail_reads)) {
        return std::unexpected(infra::make_error(fail_code, "injected read failure"));
    }
    auto data = inner_.read(path, offset, length);
    if (data) {
        if (!data->empty() && take(corrupt_reads)) {
            data->front() = static_cast<char>(~data->front());
        }
        count_towards_cancel(good_reads_, cancel_after_reads);
    }
    return data;
}

auto FaultyStore::write(const std::filesystem::path& path, std::span<const char> data,
                        bool overwrite) -> infra::VoidResult
{
    ++writes;
    check_watch();
    if (take(fail_writes)) {
        return std::unexpected(infra::make_error(fail_code, "injected write failure"));
    }
    auto res = inner_.write(path, data, overwrite);
    if (res) {
        count_towards_cancel(good_writes_, cancel_after_writes);
    }
    return res;
}

auto FaultyStore::append(const std::filesystem::path& path, std::span<const char> data) -> infra::VoidResult {
    ++writes;
    check_watch();
    if (take(fail_writes)) {
        return std::unexpected(infra::make_error(fail_code, "injected append failure"));
    }
    return inner_.append(path, data);
}

auto FaultyStore::concat(const std::filesystem::path& target,
                         const std::vector<std::filesystem::path>& parts) -> infra::VoidResult
{
    ++concats;
    if (take(fail_concats)) {
        return std::unexpected(infra::make_error(fail_code, "injected concat failure"));
    }
    return inner_.concat(target, parts);
}

auto FaultyStore::remove(const std::filesystem::path& path, bool recursive) -> infra::VoidResult {
    return inner_.remove(path, recursive);
}

auto FaultyStore::info(const std::filesystem::path& path) const -> infra::Result<adapters::ObjectInfo> {
    return inner_.info(path);
}

auto FaultyStore::du(const std::filesystem::path& path, bool deep) const
    -> infra::Result<std::map<std::filesystem::path, std::uint64_t>>
{
    return inner_.du(path, deep);
}

} // namespace bxfer::test
