#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include <filesystem>
#include <memory>
#include <optional>

namespace zulu::crypto {

/**
 * BLAKE3 cryptographic hash function wrapper
 */
class Blake3 {
public:
    /**
     * Hash data using BLAKE3
     * @param data The data to hash
     * @return 32-byte hash
     */
    static Hash256 hash(const bytes& data);

    /**
     * Hash a raw buffer in place (no copy)
     */
    static Hash256 hash(const byte* data, size_t len);

    /**
     * Hash a string using BLAKE3
     */
    static Hash256 hash(const std::string& str);

    /**
     * Hash the concatenation of a sequence of digests without materializing it
     */
    static Hash256 hash_many(const std::vector<Hash256>& digests);

    /**
     * Stream a file through the hasher with a fixed 1 MiB buffer
     */
    static Result<Hash256> hash_file(const std::filesystem::path& path);

    /**
     * Convert hash to hex string
     */
    static std::string hash_to_hex(const Hash256& hash);

    /**
     * Parse hash from hex string
     */
    static std::optional<Hash256> hash_from_hex(const std::string& hex);
};

/**
 * Incremental BLAKE3 hasher.
 * Feeding the same bytes in any split produces the one-shot digest.
 */
class Blake3Hasher {
public:
    Blake3Hasher();
    ~Blake3Hasher();

    Blake3Hasher(const Blake3Hasher&) = delete;
    Blake3Hasher& operator=(const Blake3Hasher&) = delete;
    Blake3Hasher(Blake3Hasher&&) noexcept;
    Blake3Hasher& operator=(Blake3Hasher&&) noexcept;

    void update(const byte* data, size_t len);
    void update(const bytes& data) { update(data.data(), data.size()); }

    /**
     * Produce the digest of everything fed so far. The hasher state is not
     * consumed; further updates continue the same stream.
     */
    Hash256 finalize() const;

    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace zulu::crypto
