#include "sha2.hpp"
#include "random.hpp"
#include <sodium.h>
#include <algorithm>
#include <stdexcept>

namespace zulu::crypto {

Hash256 Sha2::sha256(const bytes& data) {
    Random::ensure_initialized();
    Hash256 out;
    crypto_hash_sha256(out.data(), data.data(), data.size());
    return out;
}

Hash256 Sha2::sha256(const std::string& data) {
    Random::ensure_initialized();
    Hash256 out;
    crypto_hash_sha256(out.data(), reinterpret_cast<const unsigned char*>(data.data()), data.size());
    return out;
}

Hash512 Sha2::hmac_sha512(const bytes& key, const bytes& message) {
    Random::ensure_initialized();
    Hash512 out;
    crypto_auth_hmacsha512_state state;
    crypto_auth_hmacsha512_init(&state, key.data(), key.size());
    crypto_auth_hmacsha512_update(&state, message.data(), message.size());
    crypto_auth_hmacsha512_final(&state, out.data());
    sodium_memzero(&state, sizeof(state));
    return out;
}

bytes Sha2::pbkdf2_hmac_sha512(
    const bytes& password,
    const bytes& salt,
    uint32_t iterations,
    size_t output_len
) {
    if (iterations == 0) {
        throw std::invalid_argument("PBKDF2 iteration count must be positive");
    }
    Random::ensure_initialized();

    // The keyed state is computed once and copied for every PRF invocation
    crypto_auth_hmacsha512_state keyed;
    crypto_auth_hmacsha512_init(&keyed, password.data(), password.size());

    bytes output;
    output.reserve(output_len);

    Hash512 u;
    Hash512 t;
    for (uint32_t block = 1; output.size() < output_len; ++block) {
        byte counter[4] = {
            static_cast<byte>(block >> 24),
            static_cast<byte>(block >> 16),
            static_cast<byte>(block >> 8),
            static_cast<byte>(block)
        };

        crypto_auth_hmacsha512_state state = keyed;
        crypto_auth_hmacsha512_update(&state, salt.data(), salt.size());
        crypto_auth_hmacsha512_update(&state, counter, sizeof(counter));
        crypto_auth_hmacsha512_final(&state, u.data());
        t = u;

        for (uint32_t i = 1; i < iterations; ++i) {
            state = keyed;
            crypto_auth_hmacsha512_update(&state, u.data(), u.size());
            crypto_auth_hmacsha512_final(&state, u.data());
            for (size_t j = 0; j < t.size(); ++j) {
                t[j] ^= u[j];
            }
        }
        sodium_memzero(&state, sizeof(state));

        size_t take = std::min(t.size(), output_len - output.size());
        output.insert(output.end(), t.begin(), t.begin() + take);
    }

    sodium_memzero(&keyed, sizeof(keyed));
    sodium_memzero(u.data(), u.size());
    sodium_memzero(t.data(), t.size());
    return output;
}

} // namespace zulu::crypto
