#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include "key_pair.hpp"
#include <string>
#include <vector>

namespace zulu::keys {

/**
 * SLIP-0010 hierarchical deterministic key for the ed25519 curve.
 * Only hardened derivation exists on ed25519.
 */
class HdKey {
public:
    static constexpr uint32_t HARDENED_OFFSET = 0x80000000u;

    ~HdKey();
    HdKey(const HdKey&) = default;
    HdKey& operator=(const HdKey&) = default;

    /**
     * Master node: HMAC-SHA512(key = "ed25519 seed", data = seed)
     * @param seed 16-64 byte seed (BIP-39 seeds are 64 bytes)
     */
    static Result<HdKey> master_from_seed(const bytes& seed);

    /**
     * Derive a child. index must carry the hardened bit.
     */
    Result<HdKey> derive_child(uint32_t index) const;

    /**
     * Walk a path such as m/44'/1337'/0'/0'/0' from the seed
     */
    static Result<HdKey> derive_path(const bytes& seed, const std::string& path);

    /**
     * Parse "m/a'/b'/..." into hardened indices. Accepts ' or H/h as the
     * hardened marker; unhardened segments are rejected.
     */
    static Result<std::vector<uint32_t>> parse_path(const std::string& path);

    const fixed_bytes<32>& private_key() const { return key_; }
    const fixed_bytes<32>& chain_code() const { return chain_code_; }
    uint32_t depth() const { return depth_; }

    PublicKey public_key() const;

    KeyPair to_key_pair(const std::string& path = "") const;

private:
    HdKey(const fixed_bytes<32>& key, const fixed_bytes<32>& chain_code, uint32_t depth)
        : key_(key), chain_code_(chain_code), depth_(depth) {}

    static HdKey from_hmac(const fixed_bytes<64>& digest, uint32_t depth);

    fixed_bytes<32> key_;
    fixed_bytes<32> chain_code_;
    uint32_t depth_;
};

/**
 * Derives signing keys at m / purpose' / 1337' / account' / 0' / index'
 */
class KeyDerivation {
public:
    static std::string path_for(uint32_t account, uint32_t index,
                                uint32_t purpose = constants::DEFAULT_PURPOSE);

    /**
     * Deterministically derive a key pair from a BIP-39 seed.
     * Distinct (account, index) pairs give distinct keys.
     */
    static Result<KeyPair> derive(
        const bytes& seed,
        uint32_t account = 0,
        uint32_t index = 0,
        uint32_t purpose = constants::DEFAULT_PURPOSE
    );
};

} // namespace zulu::keys
