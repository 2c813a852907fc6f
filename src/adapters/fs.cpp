#include "fs.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>
#include <fmt/core.h>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace bxfer::adapters::fs {

namespace {

auto errno_error(std::string_view op, const std::filesystem::path& path, int err,
                 const std::source_location& loc = std::source_location::current()) -> infra::Error
{
    infra::ErrorCode code = infra::ErrorCode::Io;
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            code = infra::ErrorCode::NotFound;
            break;
        case EACCES:
        case EPERM:
        case EROFS:
            code = infra::ErrorCode::PermissionDenied;
            break;
        default:
            break;
    }
    return infra::make_error(code,
        fmt::format("{} {}: {}", op, path.string(), std::strerror(err)), loc);
}

auto ec_error(std::string_view op, const std::filesystem::path& path, const std::error_code& ec,
              const std::source_location& loc = std::source_location::current()) -> infra::Error
{
    return errno_error(op, path, ec.value(), loc);
}

} // namespace

// =============== File ===============

File::File(int fd, std::filesystem::path path) noexcept
    : fd_(fd), path_(std::move(path)) {}

File::~File() {
    close_();
}

File::File(File&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        close_();
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

void File::close_() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

auto File::read_at(std::uint64_t offset, std::size_t length) const -> infra::Result<std::vector<char>> {
    std::vector<char> buffer(length);
    std::size_t done = 0;
    while (done < length) {
        ssize_t n = ::pread(fd_, buffer.data() + done, length - done,
                            static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_error("pread", path_, errno));
        }
        if (n == 0) break; // EOF
        done += static_cast<std::size_t>(n);
    }
    buffer.resize(done);
    return buffer;
}

auto File::write_at(std::uint64_t offset, std::span<const char> data) const -> infra::VoidResult {
    std::size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::pwrite(fd_, data.data() + done, data.size() - done,
                             static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_error("pwrite", path_, errno));
        }
        done += static_cast<std::size_t>(n);
    }
    return {};
}

auto File::size() const -> infra::Result<std::uint64_t> {
    struct stat sb;
    if (::fstat(fd_, &sb) == -1) {
        return std::unexpected(errno_error("fstat", path_, errno));
    }
    return static_cast<std::uint64_t>(sb.st_size);
}

auto open(const std::filesystem::path& path, OpenMode mode) -> infra::Result<File> {
    const int flags = mode == OpenMode::Read ? O_RDONLY : (O_WRONLY | O_CREAT);
    int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd == -1) {
        return std::unexpected(errno_error("open", path, errno));
    }
    return File{fd, path};
}

// =============== LocalFs ===============

auto LocalFs::exists(const std::filesystem::path& path) const -> bool {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

auto LocalFs::is_dir(const std::filesystem::path& path) const -> bool {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

auto LocalFs::list(const std::filesystem::path& dir) const -> infra::Result<std::vector<Entry>> {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(ec_error("list", dir, ec));
    }

    std::vector<Entry> entries;
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(ec_error("list", dir, ec));
        }
        const auto& entry = *it;
        std::error_code entry_ec;
        const bool directory = entry.is_directory(entry_ec);
        std::uint64_t bytes = 0;
        if (!directory) {
            bytes = entry.file_size(entry_ec);
            if (entry_ec) {
                // Dangling symlinks and special files are not transferable
                continue;
            }
        }
        entries.push_back(Entry{
            .name = entry.path().filename().string(),
            .is_dir = directory,
            .size = bytes,
        });
    }
    if (ec) {
        return std::unexpected(ec_error("list", dir, ec));
    }
    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b) { return a.name < b.name; });
    return entries;
}

auto LocalFs::size(const std::filesystem::path& path) const -> infra::Result<std::uint64_t> {
    std::error_code ec;
    auto bytes = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(ec_error("stat", path, ec));
    }
    return static_cast<std::uint64_t>(bytes);
}

auto LocalFs::make_dirs(const std::filesystem::path& dir) -> infra::VoidResult {
    if (dir.empty()) {
        return {};
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(ec_error("mkdir", dir, ec));
    }
    return {};
}

auto LocalFs::resize(const std::filesystem::path& path, std::uint64_t length) -> infra::VoidResult {
    auto file = open(path, OpenMode::Write);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }
    std::error_code ec;
    std::filesystem::resize_file(path, length, ec);
    if (ec) {
        return std::unexpected(ec_error("truncate", path, ec));
    }
    return {};
}

} // namespace bxfer::adapters::fs
