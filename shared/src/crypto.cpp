#include "filedepot/crypto.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace filedepot::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    Sha256::Sha256() : state_(std::make_unique<crypto_hash_sha256_state>())
    {
        ensure_initialized_once();
        if (crypto_hash_sha256_init(state_.get()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }
    }

    Sha256::~Sha256() = default;

    Sha256::Sha256(Sha256 &&other) noexcept = default;

    Sha256 &Sha256::operator=(Sha256 &&other) noexcept = default;

    void Sha256::update(std::span<const std::byte> data)
    {
        if (!state_ || finalized_)
        {
            throw std::logic_error("SHA-256 accumulator already finalized");
        }
        if (crypto_hash_sha256_update(state_.get(), reinterpret_cast<const unsigned char *>(data.data()),
                                      data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_update failed");
        }
    }

    void Sha256::update(std::span<const char> data)
    {
        update(std::as_bytes(data));
    }

    std::string Sha256::finalize()
    {
        if (!state_ || finalized_)
        {
            throw std::logic_error("SHA-256 accumulator already finalized");
        }
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256_final(state_.get(), digest.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        finalized_ = true;
        return to_hex(digest);
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        Sha256 hash;
        hash.update(data);
        return hash.finalize();
    }

    std::string hash_stream(std::istream &input)
    {
        Sha256 hash;
        std::vector<char> buffer(64 * 1024);
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                hash.update(std::span<const char>(buffer.data(), read_count));
            }
        }
        if (input.bad())
        {
            throw std::runtime_error("Failed to read stream for hashing");
        }
        return hash.finalize();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    bool digests_equal(std::string_view lhs, std::string_view rhs)
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        ensure_initialized_once();
        const auto left = to_lower(lhs);
        const auto right = to_lower(rhs);
        return sodium_memcmp(left.data(), right.data(), left.size()) == 0;
    }

    std::string random_hex(std::size_t byte_count)
    {
        ensure_initialized_once();
        std::vector<unsigned char> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        return to_hex(bytes);
    }

} // namespace filedepot::crypto
