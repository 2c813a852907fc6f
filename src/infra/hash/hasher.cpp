#include "hasher.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <new>
#include <vector>

namespace bxfer::infra {

namespace {
constexpr std::size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
}

Hasher::Hasher(XXH64_hash_t seed)
    : state_(XXH64_createState())
{
    if (!state_) {
        throw std::bad_alloc();
    }
    XXH64_reset(state_.get(), seed);
}

void Hasher::update(const void* data, std::size_t size) {
    XXH64_update(state_.get(), data, size);
}

void Hasher::update_field(std::string_view field) {
    update_field(static_cast<std::uint64_t>(field.size()));
    update(field);
}

void Hasher::update_field(std::uint64_t value) {
    unsigned char bytes[8];
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xFF);
    }
    update(bytes, sizeof(bytes));
}

auto Hasher::digest() const -> XXH64_hash_t {
    return XXH64_digest(state_.get());
}

auto Hasher::hex_digest() const -> std::string {
    return fmt::format("{:016x}", digest());
}

auto hash_file(const std::filesystem::path& path) -> Result<XXH64_hash_t>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::NotFound,
                                          fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    Hasher hasher;
    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        hasher.update(buffer.data(), static_cast<std::size_t>(file.gcount()));
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::Io,
                                          fmt::format("Error reading file: {}", path.string())));
    }

    return hasher.digest();
}

} // namespace bxfer::infra
