#include "hd_key.hpp"
#include "crypto/ed25519.hpp"
#include "crypto/sha2.hpp"
#include <sodium.h>
#include <algorithm>
#include <sstream>

namespace zulu::keys {

namespace {

const char* CURVE_SEED_KEY = "ed25519 seed";

} // anonymous namespace

HdKey::~HdKey() {
    sodium_memzero(key_.data(), key_.size());
    sodium_memzero(chain_code_.data(), chain_code_.size());
}

HdKey HdKey::from_hmac(const fixed_bytes<64>& digest, uint32_t depth) {
    fixed_bytes<32> key;
    fixed_bytes<32> chain_code;
    std::copy(digest.begin(), digest.begin() + 32, key.begin());
    std::copy(digest.begin() + 32, digest.end(), chain_code.begin());
    HdKey node(key, chain_code, depth);
    sodium_memzero(key.data(), key.size());
    sodium_memzero(chain_code.data(), chain_code.size());
    return node;
}

Result<HdKey> HdKey::master_from_seed(const bytes& seed) {
    if (seed.size() < 16 || seed.size() > 64) {
        return Result<HdKey>::Err(ErrorCode::InvalidArgument, "Seed must be 16-64 bytes");
    }

    std::string curve_key(CURVE_SEED_KEY);
    auto digest = crypto::Sha2::hmac_sha512(bytes(curve_key.begin(), curve_key.end()), seed);
    HdKey master = from_hmac(digest, 0);
    sodium_memzero(digest.data(), digest.size());
    return Result<HdKey>::Ok(master);
}

Result<HdKey> HdKey::derive_child(uint32_t index) const {
    if (index < HARDENED_OFFSET) {
        return Result<HdKey>::Err(ErrorCode::InvalidArgument,
                                  "ed25519 supports hardened derivation only");
    }

    // data = 0x00 || key || ser32(index)
    bytes data;
    data.reserve(1 + key_.size() + 4);
    data.push_back(0x00);
    data.insert(data.end(), key_.begin(), key_.end());
    data.push_back(static_cast<byte>(index >> 24));
    data.push_back(static_cast<byte>(index >> 16));
    data.push_back(static_cast<byte>(index >> 8));
    data.push_back(static_cast<byte>(index));

    auto digest = crypto::Sha2::hmac_sha512(bytes(chain_code_.begin(), chain_code_.end()), data);
    HdKey child = from_hmac(digest, depth_ + 1);

    sodium_memzero(data.data(), data.size());
    sodium_memzero(digest.data(), digest.size());
    return Result<HdKey>::Ok(child);
}

Result<std::vector<uint32_t>> HdKey::parse_path(const std::string& path) {
    using R = Result<std::vector<uint32_t>>;

    std::vector<std::string> segments;
    std::stringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        segments.push_back(segment);
    }

    if (segments.empty() || segments[0] != "m") {
        return R::Err(ErrorCode::InvalidArgument, "Derivation path must start with m: " + path);
    }

    std::vector<uint32_t> indices;
    for (size_t i = 1; i < segments.size(); ++i) {
        std::string seg = segments[i];
        if (seg.size() < 2) {
            return R::Err(ErrorCode::InvalidArgument, "Invalid path segment in " + path);
        }
        char marker = seg.back();
        if (marker != '\'' && marker != 'H' && marker != 'h') {
            return R::Err(ErrorCode::InvalidArgument,
                          "ed25519 supports hardened derivation only: " + path);
        }
        seg.pop_back();
        if (!std::all_of(seg.begin(), seg.end(), [](char c) { return c >= '0' && c <= '9'; }) ||
            seg.size() > 10) {
            return R::Err(ErrorCode::InvalidArgument, "Invalid path segment in " + path);
        }
        uint64_t value = std::stoull(seg);
        if (value >= HARDENED_OFFSET) {
            return R::Err(ErrorCode::OutOfRange, "Path index too large in " + path);
        }
        indices.push_back(static_cast<uint32_t>(value) | HARDENED_OFFSET);
    }
    return R::Ok(std::move(indices));
}

Result<HdKey> HdKey::derive_path(const bytes& seed, const std::string& path) {
    ZULU_TRY_UNWRAP(indices, parse_path(path));
    ZULU_TRY_UNWRAP(node, master_from_seed(seed));

    for (uint32_t index : indices) {
        ZULU_TRY_UNWRAP(child, node.derive_child(index));
        node = child;
    }
    return Result<HdKey>::Ok(node);
}

PublicKey HdKey::public_key() const {
    return crypto::Ed25519::keypair_from_seed(key_).first;
}

KeyPair HdKey::to_key_pair(const std::string& path) const {
    return KeyPair::from_seed(key_, path);
}

// KeyDerivation

std::string KeyDerivation::path_for(uint32_t account, uint32_t index, uint32_t purpose) {
    std::ostringstream oss;
    oss << "m/" << purpose << "'/" << constants::ZULU_COIN_TYPE << "'/"
        << account << "'/0'/" << index << "'";
    return oss.str();
}

Result<KeyPair> KeyDerivation::derive(
    const bytes& seed,
    uint32_t account,
    uint32_t index,
    uint32_t purpose
) {
    if (account >= HdKey::HARDENED_OFFSET || index >= HdKey::HARDENED_OFFSET ||
        purpose >= HdKey::HARDENED_OFFSET) {
        return Result<KeyPair>::Err(ErrorCode::OutOfRange, "Derivation index must be below 2^31");
    }

    std::string path = path_for(account, index, purpose);
    ZULU_TRY_UNWRAP(node, HdKey::derive_path(seed, path));
    return Result<KeyPair>::Ok(node.to_key_pair(path));
}

} // namespace zulu::keys
