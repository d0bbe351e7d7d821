#pragma once

#include "zulu/common.hpp"
#include <string>

namespace zulu::crypto {

using Hash512 = fixed_bytes<64>;

/**
 * SHA-2 family helpers on top of libsodium
 */
class Sha2 {
public:
    static Hash256 sha256(const bytes& data);
    static Hash256 sha256(const std::string& data);

    /**
     * HMAC-SHA-512 with an arbitrary-length key
     */
    static Hash512 hmac_sha512(const bytes& key, const bytes& message);

    /**
     * PBKDF2 (RFC 8018) with HMAC-SHA-512 as the PRF
     * @param password Password bytes
     * @param salt Salt bytes
     * @param iterations Iteration count (>= 1)
     * @param output_len Derived key length
     */
    static bytes pbkdf2_hmac_sha512(
        const bytes& password,
        const bytes& salt,
        uint32_t iterations,
        size_t output_len
    );
};

} // namespace zulu::crypto
