#pragma once

#include "zulu/common.hpp"

namespace zulu::crypto {

/**
 * Random number generation (CSPRNG)
 * Cryptographically secure random bytes
 */
class Random {
public:
    /**
     * Initialize libsodium once per process.
     * Every crypto wrapper calls this before touching libsodium.
     * @throws CryptoException if libsodium cannot be initialized
     */
    static void ensure_initialized();

    /**
     * Generate random bytes
     * @param size Number of bytes to generate
     * @return Random bytes
     */
    static bytes generate(size_t size);


    /**
     * Generate random bytes into existing buffer
     */
    static void generate_into(byte* buffer, size_t size);


    template<size_t N>
    static fixed_bytes<N> generate_fixed() {
        fixed_bytes<N> out;
        generate_into(out.data(), out.size());
        return out;
    }
};

} // namespace zulu::crypto
