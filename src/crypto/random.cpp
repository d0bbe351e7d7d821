#include "random.hpp"
#include "zulu/error.hpp"
#include <sodium.h>

namespace zulu::crypto {

void Random::ensure_initialized() {
    static const bool initialized = [] {
        if (sodium_init() < 0) {
            throw CryptoException(ErrorCode::CryptoInitFailed, "Failed to initialize libsodium");
        }
        return true;
    }();
    ZULU_UNUSED(initialized);
}

bytes Random::generate(size_t size) {
    ensure_initialized();
    bytes result(size);
    randombytes_buf(result.data(), size);
    return result;
}

void Random::generate_into(byte* buffer, size_t size) {
    ensure_initialized();
    randombytes_buf(buffer, size);
}

} // namespace zulu::crypto
