#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <algorithm>

// Zulu Framework Version
#define ZULU_VERSION_MAJOR 0
#define ZULU_VERSION_MINOR 3
#define ZULU_VERSION_PATCH 0
#define ZULU_VERSION_STRING "0.3.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef ZULU_PLATFORM_WINDOWS
        #define ZULU_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef ZULU_PLATFORM_LINUX
        #define ZULU_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef ZULU_PLATFORM_MACOS
        #define ZULU_PLATFORM_MACOS
    #endif
#endif

// Utility macros
#define ZULU_UNUSED(x) (void)(x)
#define ZULU_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define ZULU_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define ZULU_DISALLOW_COPY_AND_MOVE(TypeName) \
    ZULU_DISALLOW_COPY(TypeName); \
    ZULU_DISALLOW_MOVE(TypeName)

// Constants
namespace zulu {
namespace constants {

// Chunk sizes per artifact type (fixed, recorded in the manifest via the type tag)
constexpr uint32_t MODEL_CHUNK_SIZE = 1024 * 1024;   // 1 MiB
constexpr uint32_t MEMORY_CHUNK_SIZE = 64 * 1024;    // 64 KiB
constexpr uint32_t PLUGIN_CHUNK_SIZE = 256 * 1024;   // 256 KiB
constexpr uint32_t UI_CHUNK_SIZE = 512 * 1024;       // 512 KiB

// Manifest format
constexpr const char* MANIFEST_VERSION = "1.0";

// Downloader
constexpr size_t RESUME_REVERIFY_CHUNKS = 5;

// Trust defaults
constexpr uint32_t DEFAULT_EXPIRY_WARNING_DAYS = 30;
constexpr uint32_t TEAM_KEY_LIFETIME_DAYS = 730;
constexpr uint32_t USER_KEY_LIFETIME_DAYS = 182;
constexpr uint64_t SECONDS_PER_DAY = 86400;

// Key derivation (m / purpose' / coin_type' / account' / 0' / index')
constexpr uint32_t DEFAULT_PURPOSE = 44;
constexpr uint32_t ZULU_COIN_TYPE = 1337;

// Cryptography constants
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SECRET_KEY_SIZE = 64;  // libsodium uses 64 bytes (32-byte seed + 32-byte public key)
constexpr size_t ED25519_SEED_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;
constexpr size_t CHACHA20_KEY_SIZE = 32;
constexpr size_t CHACHA20_NONCE_SIZE = 12;
constexpr size_t POLY1305_TAG_SIZE = 16;
constexpr size_t BLAKE3_HASH_SIZE = 32;
constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t SHA512_HASH_SIZE = 64;

} // namespace constants
} // namespace zulu

// Core types
namespace zulu {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

// Cryptographic types
template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Hash256 = fixed_bytes<32>;
using PublicKey = fixed_bytes<32>;
using SecretKey = fixed_bytes<64>;  // Ed25519 secret key is 64 bytes in libsodium
using Signature = fixed_bytes<64>;
using Nonce = fixed_bytes<12>;
using SessionKey = fixed_bytes<32>;

// Utility functions
std::string hash_to_hex(const Hash256& hash);
Hash256 hex_to_hash(const std::string& hex);

// Generic hex helpers (lowercase output, case-insensitive input)
std::string to_hex(const byte* data, size_t len);
std::string to_hex(const bytes& data);
std::optional<bytes> from_hex(const std::string& hex);

/**
 * Parse exactly N bytes of hex into a fixed-size array
 */
template<size_t N>
std::optional<fixed_bytes<N>> fixed_from_hex(const std::string& hex) {
    if (hex.size() != N * 2) {
        return std::nullopt;
    }
    auto decoded = from_hex(hex);
    if (!decoded) {
        return std::nullopt;
    }
    fixed_bytes<N> out;
    std::copy(decoded->begin(), decoded->end(), out.begin());
    return out;
}

template<size_t N>
std::string to_hex(const fixed_bytes<N>& data) {
    return to_hex(data.data(), data.size());
}

} // namespace zulu

// Hash support for std::unordered_map
namespace std {
template<>
struct hash<zulu::Hash256> {
    size_t operator()(const zulu::Hash256& h) const noexcept {
        // Hash first 8 bytes
        size_t result = 0;
        for (size_t i = 0; i < 8 && i < h.size(); ++i) {
            result = (result << 8) | h[i];
        }
        return result;
    }
};
} // namespace std
