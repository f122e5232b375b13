/**
 * FileDepot - Hashing and random helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct crypto_hash_sha256_state;

namespace filedepot::crypto
{

    void ensure_sodium_init();

    /**
     * Incremental SHA-256 over a byte stream. Feed bytes as they move across the
     * wire and call finalize() once the declared count has been reached.
     */
    class Sha256
    {
    public:
        Sha256();
        ~Sha256();

        Sha256(Sha256 &&other) noexcept;
        Sha256 &operator=(Sha256 &&other) noexcept;

        Sha256(const Sha256 &) = delete;
        Sha256 &operator=(const Sha256 &) = delete;

        void update(std::span<const std::byte> data);
        void update(std::span<const char> data);

        // Lowercase hex digest. The accumulator cannot be updated afterwards.
        std::string finalize();

    private:
        std::unique_ptr<crypto_hash_sha256_state> state_;
        bool finalized_{false};
    };

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Case-insensitive, constant-time comparison of two hex digests.
    bool digests_equal(std::string_view lhs, std::string_view rhs);

    std::string random_hex(std::size_t byte_count);

} // namespace filedepot::crypto
