#pragma once

#include "zulu/common.hpp"
#include <string>
#include <optional>
#include <utility>

namespace zulu::crypto {

/**
 * Ed25519 digital signature wrapper
 * Provides signing and verification using libsodium
 */
class Ed25519 {
public:
    /**
     * Generate a new random Ed25519 keypair
     * @return pair of (public_key, secret_key)
     */
    static std::pair<PublicKey, SecretKey> generate_keypair();

    /**
     * Deterministically expand a 32-byte seed into a keypair
     * @param seed 32-byte Ed25519 seed (private scalar source)
     */
    static std::pair<PublicKey, SecretKey> keypair_from_seed(const fixed_bytes<32>& seed);

    /**
     * Sign a message with a secret key
     * @param message The message to sign
     * @param secret_key The secret key to sign with
     * @return The signature
     */
    static Signature sign(const bytes& message, const SecretKey& secret_key);
    static Signature sign(const std::string& message, const SecretKey& secret_key);

    /**
     * Verify a signature over the exact message bytes
     * @return true if signature is valid
     */
    static bool verify(const bytes& message, const Signature& signature, const PublicKey& public_key);
    static bool verify(const std::string& message, const Signature& signature, const PublicKey& public_key);

    /**
     * Derive public key from secret key
     */
    static PublicKey secret_to_public(const SecretKey& secret_key);

    static std::string public_key_to_hex(const PublicKey& key);
    static std::optional<PublicKey> public_key_from_hex(const std::string& hex);
};

} // namespace zulu::crypto
