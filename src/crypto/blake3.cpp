#include "blake3.hpp"
#include "utils/file_io.hpp"
#include <blake3.h>

namespace zulu::crypto {

Hash256 Blake3::hash(const bytes& data) {
    return hash(data.data(), data.size());
}

Hash256 Blake3::hash(const byte* data, size_t len) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

Hash256 Blake3::hash(const std::string& str) {
    return hash(reinterpret_cast<const byte*>(str.data()), str.size());
}

Hash256 Blake3::hash_many(const std::vector<Hash256>& digests) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    for (const auto& digest : digests) {
        blake3_hasher_update(&hasher, digest.data(), digest.size());
    }
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

Result<Hash256> Blake3::hash_file(const std::filesystem::path& path) {
    ZULU_TRY_UNWRAP(file, utils::File::open(path, utils::File::Mode::ReadOnly));

    Blake3Hasher hasher;
    bytes buffer(1024 * 1024);
    uint64_t offset = 0;
    while (true) {
        ZULU_TRY_UNWRAP(n, file.read_at(offset, buffer.data(), buffer.size()));
        if (n == 0) break;
        hasher.update(buffer.data(), n);
        offset += n;
    }
    return Result<Hash256>::Ok(hasher.finalize());
}

std::string Blake3::hash_to_hex(const Hash256& hash) {
    return to_hex(hash);
}

std::optional<Hash256> Blake3::hash_from_hex(const std::string& hex) {
    return fixed_from_hex<32>(hex);
}

// Blake3Hasher

class Blake3Hasher::Impl {
public:
    Impl() { blake3_hasher_init(&hasher); }
    blake3_hasher hasher;
};

Blake3Hasher::Blake3Hasher() : impl_(std::make_unique<Impl>()) {}
Blake3Hasher::~Blake3Hasher() = default;
Blake3Hasher::Blake3Hasher(Blake3Hasher&&) noexcept = default;
Blake3Hasher& Blake3Hasher::operator=(Blake3Hasher&&) noexcept = default;

void Blake3Hasher::update(const byte* data, size_t len) {
    blake3_hasher_update(&impl_->hasher, data, len);
}

Hash256 Blake3Hasher::finalize() const {
    Hash256 result;
    blake3_hasher_finalize(&impl_->hasher, result.data(), result.size());
    return result;
}

void Blake3Hasher::reset() {
    blake3_hasher_reset(&impl_->hasher);
}

} // namespace zulu::crypto
