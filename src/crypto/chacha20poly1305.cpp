#include "chacha20poly1305.hpp"
#include "random.hpp"
#include "zulu/error.hpp"
#include <sodium.h>

namespace zulu::crypto {

bytes ChaCha20Poly1305::encrypt(const bytes& plaintext, const SessionKey& key, const Nonce& nonce,
                                const bytes& aad) {
    Random::ensure_initialized();
    bytes ciphertext(plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);
    unsigned long long ciphertext_len;

    if (crypto_aead_chacha20poly1305_ietf_encrypt(
        ciphertext.data(),
        &ciphertext_len,
        plaintext.data(),
        plaintext.size(),
        aad.empty() ? nullptr : aad.data(),
        aad.size(),
        nullptr, // not used
        nonce.data(),
        key.data()
    ) != 0) {
        throw CryptoException(ErrorCode::CryptoEncryptionFailed, "ChaCha20-Poly1305 encryption failed");
    }

    ciphertext.resize(ciphertext_len);
    return ciphertext;
}

std::optional<bytes> ChaCha20Poly1305::decrypt(const bytes& ciphertext, const SessionKey& key,
                                               const Nonce& nonce, const bytes& aad) {
    Random::ensure_initialized();
    if (ciphertext.size() < crypto_aead_chacha20poly1305_ietf_ABYTES) {
        return std::nullopt; // Ciphertext too short
    }

    bytes plaintext(ciphertext.size() - crypto_aead_chacha20poly1305_ietf_ABYTES);
    unsigned long long plaintext_len;

    if (crypto_aead_chacha20poly1305_ietf_decrypt(
        plaintext.data(),
        &plaintext_len,
        nullptr, // not used
        ciphertext.data(),
        ciphertext.size(),
        aad.empty() ? nullptr : aad.data(),
        aad.size(),
        nonce.data(),
        key.data()
    ) != 0) {
        return std::nullopt; // Authentication failed
    }

    plaintext.resize(plaintext_len);
    return plaintext;
}

SessionKey ChaCha20Poly1305::generate_key() {
    return Random::generate_fixed<32>();
}

Nonce ChaCha20Poly1305::generate_nonce() {
    return Random::generate_fixed<12>();
}

} // namespace zulu::crypto
