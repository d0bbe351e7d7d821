#include "key_pair.hpp"
#include "crypto/ed25519.hpp"
#include <sodium.h>

namespace zulu::keys {

KeyPair::KeyPair(const PublicKey& public_key, const SecretKey& secret_key, std::string path)
    : public_key_(public_key)
    , secret_key_(secret_key)
    , path_(std::move(path))
{}

KeyPair::~KeyPair() {
    wipe();
}

KeyPair::KeyPair(KeyPair&& other) noexcept
    : public_key_(other.public_key_)
    , secret_key_(other.secret_key_)
    , path_(std::move(other.path_))
{
    other.wipe();
}

KeyPair& KeyPair::operator=(KeyPair&& other) noexcept {
    if (this != &other) {
        public_key_ = other.public_key_;
        secret_key_ = other.secret_key_;
        path_ = std::move(other.path_);
        other.wipe();
    }
    return *this;
}

KeyPair KeyPair::generate() {
    auto [pk, sk] = crypto::Ed25519::generate_keypair();
    KeyPair pair(pk, sk);
    sodium_memzero(sk.data(), sk.size());
    return pair;
}

KeyPair KeyPair::from_seed(const fixed_bytes<32>& seed, std::string path) {
    auto [pk, sk] = crypto::Ed25519::keypair_from_seed(seed);
    KeyPair pair(pk, sk, std::move(path));
    sodium_memzero(sk.data(), sk.size());
    return pair;
}

Signature KeyPair::sign(const bytes& message) const {
    return crypto::Ed25519::sign(message, secret_key_);
}

Signature KeyPair::sign(const std::string& message) const {
    return crypto::Ed25519::sign(message, secret_key_);
}

void KeyPair::wipe() {
    sodium_memzero(secret_key_.data(), secret_key_.size());
}

} // namespace zulu::keys
