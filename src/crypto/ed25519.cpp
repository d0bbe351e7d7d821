#include "ed25519.hpp"
#include "random.hpp"
#include "zulu/error.hpp"
#include <sodium.h>

namespace zulu::crypto {

namespace {

Signature sign_raw(const byte* message, size_t len, const SecretKey& secret_key) {
    Random::ensure_initialized();
    Signature sig;
    unsigned long long sig_len;

    if (crypto_sign_detached(sig.data(), &sig_len, message, len, secret_key.data()) != 0) {
        throw CryptoException(ErrorCode::CryptoSignatureFailed, "Failed to sign message");
    }
    return sig;
}

bool verify_raw(const byte* message, size_t len, const Signature& signature, const PublicKey& public_key) {
    Random::ensure_initialized();
    return crypto_sign_verify_detached(signature.data(), message, len, public_key.data()) == 0;
}

} // anonymous namespace

std::pair<PublicKey, SecretKey> Ed25519::generate_keypair() {
    Random::ensure_initialized();
    PublicKey pk;
    SecretKey sk;

    if (crypto_sign_keypair(pk.data(), sk.data()) != 0) {
        throw CryptoException(ErrorCode::CryptoKeyGenerationFailed, "Failed to generate Ed25519 keypair");
    }

    return {pk, sk};
}

std::pair<PublicKey, SecretKey> Ed25519::keypair_from_seed(const fixed_bytes<32>& seed) {
    Random::ensure_initialized();
    PublicKey pk;
    SecretKey sk;

    if (crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data()) != 0) {
        throw CryptoException(ErrorCode::CryptoKeyGenerationFailed, "Failed to expand Ed25519 seed");
    }

    return {pk, sk};
}

Signature Ed25519::sign(const bytes& message, const SecretKey& secret_key) {
    return sign_raw(message.data(), message.size(), secret_key);
}

Signature Ed25519::sign(const std::string& message, const SecretKey& secret_key) {
    return sign_raw(reinterpret_cast<const byte*>(message.data()), message.size(), secret_key);
}

bool Ed25519::verify(const bytes& message, const Signature& signature, const PublicKey& public_key) {
    return verify_raw(message.data(), message.size(), signature, public_key);
}

bool Ed25519::verify(const std::string& message, const Signature& signature, const PublicKey& public_key) {
    return verify_raw(reinterpret_cast<const byte*>(message.data()), message.size(),
                      signature, public_key);
}

PublicKey Ed25519::secret_to_public(const SecretKey& secret_key) {
    PublicKey pk;
    if (crypto_sign_ed25519_sk_to_pk(pk.data(), secret_key.data()) != 0) {
        throw CryptoException(ErrorCode::InvalidSecretKey, "Failed to derive public key from secret key");
    }
    return pk;
}

std::string Ed25519::public_key_to_hex(const PublicKey& key) {
    return to_hex(key);
}

std::optional<PublicKey> Ed25519::public_key_from_hex(const std::string& hex) {
    return fixed_from_hex<32>(hex);
}

} // namespace zulu::crypto
