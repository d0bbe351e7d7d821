#include "argon2.hpp"
#include "random.hpp"
#include "zulu/error.hpp"
#include <sodium.h>
#include <stdexcept>

namespace zulu::crypto {

Argon2::Params Argon2::Params::from_name(const std::string& name) {
    if (name == "moderate") return moderate();
    if (name == "sensitive") return sensitive();
    if (name == "minimal") return minimal();
    return interactive();
}

bytes Argon2::hash(
    const bytes& password,
    const bytes& salt,
    const Params& params,
    size_t output_len
) {
    Random::ensure_initialized();
    if (salt.size() < crypto_pwhash_SALTBYTES) {
        throw std::invalid_argument("Salt too short (minimum 16 bytes)");
    }

    bytes hash(output_len);

    int result = crypto_pwhash(
        hash.data(),
        hash.size(),
        reinterpret_cast<const char*>(password.data()),
        password.size(),
        salt.data(),
        params.time_cost,
        static_cast<size_t>(params.memory_cost_kb) * 1024,  // Convert KB to bytes
        crypto_pwhash_ALG_ARGON2ID13
    );

    if (result != 0) {
        throw CryptoException(ErrorCode::CryptoKeyGenerationFailed, "Argon2 hashing failed (out of memory?)");
    }

    return hash;
}

bool Argon2::verify(
    const bytes& password,
    const bytes& salt,
    const bytes& expected_hash,
    const Params& params
) {
    if (salt.size() < crypto_pwhash_SALTBYTES || expected_hash.empty()) {
        return false;
    }
    bytes computed_hash = hash(password, salt, params, expected_hash.size());
    return sodium_memcmp(computed_hash.data(), expected_hash.data(), computed_hash.size()) == 0;
}

bytes Argon2::generate_salt() {
    return Random::generate(SALT_SIZE);
}

} // namespace zulu::crypto
