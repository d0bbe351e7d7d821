#pragma once

#include "zulu/common.hpp"
#include <cstdint>
#include <string>

namespace zulu::crypto {

/**
 * Argon2id memory-hard key derivation.
 * Turns a storage passphrase into the master key of the encrypted store.
 */
class Argon2 {
public:
    struct Params {
        uint32_t memory_cost_kb;    // Memory usage in KB
        uint32_t time_cost;          // Number of iterations
        uint32_t parallelism;        // Number of parallel threads

        // Presets
        static Params interactive() {
            return {65536, 2, 1};    // 64 MB, 2 iterations, 1 thread
        }

        static Params moderate() {
            return {262144, 3, 1};   // 256 MB, 3 iterations, 1 thread
        }

        static Params sensitive() {
            return {1048576, 4, 1};  // 1 GB, 4 iterations, 1 thread
        }

        // libsodium's floor; for tests only
        static Params minimal() {
            return {8, 1, 1};
        }

        /**
         * Look up a preset by name (interactive, moderate, sensitive, minimal).
         * Unknown names fall back to interactive.
         */
        static Params from_name(const std::string& name);
    };

    static constexpr size_t SALT_SIZE = 16;

    /**
     * Hash a password with Argon2id
     * @param password Password/data to hash
     * @param salt Salt (16 bytes minimum)
     * @param params Argon2 parameters
     * @param output_len Output hash length (default 32 bytes)
     * @return Hash
     * @throws std::invalid_argument on short salt, CryptoException on failure
     */
    static bytes hash(
        const bytes& password,
        const bytes& salt,
        const Params& params,
        size_t output_len = 32
    );

    /**
     * Verify a password against a hash in constant time
     */
    static bool verify(
        const bytes& password,
        const bytes& salt,
        const bytes& hash,
        const Params& params
    );

    static bytes generate_salt();
};

} // namespace zulu::crypto
