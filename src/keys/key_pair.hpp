#pragma once

#include "zulu/common.hpp"
#include <string>

namespace zulu::keys {

/**
 * Ed25519 signing key pair. The secret key is wiped when the pair is
 * destroyed or moved from, so it only lives as long as the signing
 * operation that needs it.
 */
class KeyPair {
public:
    KeyPair(const PublicKey& public_key, const SecretKey& secret_key, std::string path = "");
    ~KeyPair();

    KeyPair(const KeyPair&) = delete;
    KeyPair& operator=(const KeyPair&) = delete;
    KeyPair(KeyPair&& other) noexcept;
    KeyPair& operator=(KeyPair&& other) noexcept;

    /**
     * Generate a random (non-derived) key pair
     */
    static KeyPair generate();

    /**
     * Expand a 32-byte Ed25519 seed
     */
    static KeyPair from_seed(const fixed_bytes<32>& seed, std::string path = "");

    const PublicKey& public_key() const { return public_key_; }
    const SecretKey& secret_key() const { return secret_key_; }

    // Derivation path, empty for random keys
    const std::string& path() const { return path_; }

    // Key id: lowercase hex of the public key
    std::string key_id() const { return to_hex(public_key_); }

    Signature sign(const bytes& message) const;
    Signature sign(const std::string& message) const;

private:
    void wipe();

    PublicKey public_key_;
    SecretKey secret_key_;
    std::string path_;
};

} // namespace zulu::keys
