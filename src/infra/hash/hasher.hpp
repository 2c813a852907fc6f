#pragma once

#include <cstdint>
#include <filesystem>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace bxfer::infra {

// Streaming xxHash64. Used for job fingerprints and content digests.
class Hasher {
public:
    explicit Hasher(XXH64_hash_t seed = 0);

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept = default;
    Hasher& operator=(Hasher&&) noexcept = default;

    void update(const void* data, std::size_t size);
    void update(std::string_view bytes) { update(bytes.data(), bytes.size()); }

    // Length-prefixed so that ("ab","c") and ("a","bc") hash differently
    void update_field(std::string_view field);
    void update_field(std::uint64_t value);

    [[nodiscard]] auto digest() const -> XXH64_hash_t;
    [[nodiscard]] auto hex_digest() const -> std::string;

private:
    struct StateDeleter {
        void operator()(XXH64_state_t* state) const noexcept { XXH64_freeState(state); }
    };
    std::unique_ptr<XXH64_state_t, StateDeleter> state_;
};

// Hashes a whole local file
[[nodiscard]] auto hash_file(const std::filesystem::path& path) -> Result<XXH64_hash_t>;

} // namespace bxfer::infra
