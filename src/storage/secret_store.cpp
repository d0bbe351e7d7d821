#include "secret_store.hpp"
#include "utils/logger.hpp"
#include <sodium.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

#ifdef ZULU_PLATFORM_LINUX
#include <linux/keyctl.h>
#include <sys/syscall.h>
#include <unistd.h>
#endif

namespace zulu::storage {

namespace {

const char* SECRETS_TABLE = "secrets";
const char* SEED_PREFIX = "seed_phrase:";
const char* PRIVATE_KEY_PREFIX = "private_key:";

} // anonymous namespace

// KernelKeyringSecretStore

#ifdef ZULU_PLATFORM_LINUX

namespace {

// Possessor and user: view, read, write, search, link, setattr
constexpr uint32_t KEY_PERMISSIONS = 0x3f3f0000;

long keyring_search(const std::string& description) {
    return syscall(SYS_keyctl, KEYCTL_SEARCH, KEY_SPEC_USER_KEYRING, "user", description.c_str(), 0);
}

// Read a key payload, growing the buffer until it fits
std::optional<bytes> keyring_read(long key_id) {
    bytes buffer(256);
    for (;;) {
        long len = syscall(SYS_keyctl, KEYCTL_READ, key_id, buffer.data(), buffer.size());
        if (len < 0) {
            return std::nullopt;
        }
        if (static_cast<size_t>(len) <= buffer.size()) {
            buffer.resize(static_cast<size_t>(len));
            return buffer;
        }
        buffer.resize(static_cast<size_t>(len));
    }
}

std::string describe(long key_id) {
    std::string buffer(512, '\0');
    long len = syscall(SYS_keyctl, KEYCTL_DESCRIBE, key_id, &buffer[0], buffer.size());
    if (len <= 0) {
        return {};
    }
    buffer.resize(std::min(static_cast<size_t>(len), buffer.size()));
    if (!buffer.empty() && buffer.back() == '\0') {
        buffer.pop_back();
    }
    return buffer;
}

} // anonymous namespace

Result<void> KernelKeyringSecretStore::store(const std::string& name, const bytes& secret) {
    std::string description = std::string(DESCRIPTION_PREFIX) + name;
    long key_id = syscall(SYS_add_key, "user", description.c_str(), secret.data(), secret.size(),
                          KEY_SPEC_USER_KEYRING);
    if (key_id < 0) {
        return Result<void>::Err(ErrorCode::SecretStoreUnavailable,
                                 std::string("add_key failed: ") + std::strerror(errno));
    }
    if (syscall(SYS_keyctl, KEYCTL_SETPERM, key_id, KEY_PERMISSIONS) < 0) {
        ZULU_LOG_WARN("Could not restrict permissions on keyring entry {}", name);
    }
    return Result<void>::Ok();
}

Result<std::optional<bytes>> KernelKeyringSecretStore::retrieve(const std::string& name) {
    using R = Result<std::optional<bytes>>;
    long key_id = keyring_search(std::string(DESCRIPTION_PREFIX) + name);
    if (key_id < 0) {
        if (errno == ENOKEY || errno == EKEYREVOKED || errno == EKEYEXPIRED) {
            return R::Ok(std::nullopt);
        }
        return R::Err(ErrorCode::SecretStoreUnavailable,
                      std::string("keyring search failed: ") + std::strerror(errno));
    }
    auto payload = keyring_read(key_id);
    if (!payload) {
        return R::Err(ErrorCode::SecretStoreUnavailable,
                      std::string("keyring read failed: ") + std::strerror(errno));
    }
    return R::Ok(std::move(*payload));
}

Result<bool> KernelKeyringSecretStore::remove(const std::string& name) {
    long key_id = keyring_search(std::string(DESCRIPTION_PREFIX) + name);
    if (key_id < 0) {
        if (errno == ENOKEY) {
            return Result<bool>::Ok(false);
        }
        return Result<bool>::Err(ErrorCode::SecretStoreUnavailable,
                                 std::string("keyring search failed: ") + std::strerror(errno));
    }
    if (syscall(SYS_keyctl, KEYCTL_UNLINK, key_id, KEY_SPEC_USER_KEYRING) < 0) {
        return Result<bool>::Err(ErrorCode::SecretStoreUnavailable,
                                 std::string("keyring unlink failed: ") + std::strerror(errno));
    }
    return Result<bool>::Ok(true);
}

Result<std::vector<std::string>> KernelKeyringSecretStore::list() {
    using R = Result<std::vector<std::string>>;
    auto payload = keyring_read(KEY_SPEC_USER_KEYRING);
    if (!payload) {
        return R::Err(ErrorCode::SecretStoreUnavailable,
                      std::string("keyring read failed: ") + std::strerror(errno));
    }

    // A keyring's payload is an array of key serials;
    // descriptions look like "type;uid;gid;perm;description"
    std::vector<std::string> names;
    std::string prefix(DESCRIPTION_PREFIX);
    size_t count = payload->size() / sizeof(int32_t);
    for (size_t i = 0; i < count; ++i) {
        int32_t serial;
        std::memcpy(&serial, payload->data() + i * sizeof(int32_t), sizeof(serial));

        std::string desc = describe(serial);
        if (desc.compare(0, 5, "user;") != 0) continue;
        auto pos = desc.find(';');
        for (int field = 0; field < 3 && pos != std::string::npos; ++field) {
            pos = desc.find(';', pos + 1);
        }
        if (pos == std::string::npos) continue;
        std::string description = desc.substr(pos + 1);
        if (description.compare(0, prefix.size(), prefix) == 0) {
            names.push_back(description.substr(prefix.size()));
        }
    }
    std::sort(names.begin(), names.end());
    return R::Ok(std::move(names));
}

bool KernelKeyringSecretStore::is_available() const {
    // Probe with a throwaway key: containers often deny keyctl
    std::string description = std::string(DESCRIPTION_PREFIX) + "__probe__";
    const char probe[] = "probe";
    long key_id = syscall(SYS_add_key, "user", description.c_str(), probe, sizeof(probe) - 1,
                          KEY_SPEC_USER_KEYRING);
    if (key_id < 0) {
        return false;
    }
    auto payload = keyring_read(key_id);
    syscall(SYS_keyctl, KEYCTL_UNLINK, key_id, KEY_SPEC_USER_KEYRING);
    return payload && payload->size() == sizeof(probe) - 1;
}

#else

Result<void> KernelKeyringSecretStore::store(const std::string&, const bytes&) {
    return Result<void>::Err(ErrorCode::SecretStoreUnavailable, "Kernel keyring requires Linux");
}

Result<std::optional<bytes>> KernelKeyringSecretStore::retrieve(const std::string&) {
    return Result<std::optional<bytes>>::Err(ErrorCode::SecretStoreUnavailable, "Kernel keyring requires Linux");
}

Result<bool> KernelKeyringSecretStore::remove(const std::string&) {
    return Result<bool>::Err(ErrorCode::SecretStoreUnavailable, "Kernel keyring requires Linux");
}

Result<std::vector<std::string>> KernelKeyringSecretStore::list() {
    return Result<std::vector<std::string>>::Err(ErrorCode::SecretStoreUnavailable,
                                                 "Kernel keyring requires Linux");
}

bool KernelKeyringSecretStore::is_available() const {
    return false;
}

#endif // ZULU_PLATFORM_LINUX

// EncryptedSecretStore

EncryptedSecretStore::EncryptedSecretStore(std::shared_ptr<EncryptedStore> store)
    : store_(std::move(store))
{}

Result<void> EncryptedSecretStore::store(const std::string& name, const bytes& secret) {
    if (!store_) {
        return Result<void>::Err(ErrorCode::SecretStoreUnavailable, "No encrypted store configured");
    }
    return store_->put(SECRETS_TABLE, name, secret);
}

Result<std::optional<bytes>> EncryptedSecretStore::retrieve(const std::string& name) {
    if (!store_) {
        return Result<std::optional<bytes>>::Err(ErrorCode::SecretStoreUnavailable, "No encrypted store configured");
    }
    return store_->get(SECRETS_TABLE, name);
}

Result<bool> EncryptedSecretStore::remove(const std::string& name) {
    if (!store_) {
        return Result<bool>::Err(ErrorCode::SecretStoreUnavailable, "No encrypted store configured");
    }
    return store_->remove(SECRETS_TABLE, name);
}

Result<std::vector<std::string>> EncryptedSecretStore::list() {
    if (!store_) {
        return Result<std::vector<std::string>>::Err(ErrorCode::SecretStoreUnavailable,
                                                     "No encrypted store configured");
    }
    return store_->list(SECRETS_TABLE);
}

// SecretStoreFactory

std::unique_ptr<SecretStore> SecretStoreFactory::create(std::shared_ptr<EncryptedStore> fallback,
                                                        bool prefer_native) {
    if (prefer_native) {
        auto native = std::make_unique<KernelKeyringSecretStore>();
        if (native->is_available()) {
            ZULU_LOG_INFO("Using kernel keyring for secret storage");
            return native;
        }
        ZULU_LOG_INFO("Kernel keyring unavailable, falling back to encrypted file storage");
    } else {
        ZULU_LOG_INFO("Using encrypted file storage for secrets");
    }
    return std::make_unique<EncryptedSecretStore>(std::move(fallback));
}

// SecretManager

SecretManager::SecretManager(std::shared_ptr<EncryptedStore> fallback, bool prefer_native)
    : fallback_store_(fallback)
    , backend_(SecretStoreFactory::create(std::move(fallback), prefer_native))
{
    using_fallback_ = backend_->backend_name() == "encrypted-file";
}

void SecretManager::switch_to_fallback(const Error& cause) {
    ZULU_LOG_WARN("Secret backend {} failed ({}), switching to encrypted file storage",
                  backend_->backend_name(), cause.message());
    backend_ = std::make_unique<EncryptedSecretStore>(fallback_store_);
    using_fallback_ = true;
}

Result<void> SecretManager::store(const std::string& name, const bytes& secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = backend_->store(name, secret);
    if (result.is_err() && !using_fallback_) {
        switch_to_fallback(result.error());
        return backend_->store(name, secret);
    }
    return result;
}

Result<std::optional<bytes>> SecretManager::retrieve(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = backend_->retrieve(name);
    if (result.is_err() && !using_fallback_) {
        switch_to_fallback(result.error());
        return backend_->retrieve(name);
    }
    return result;
}

Result<bool> SecretManager::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = backend_->remove(name);
    if (result.is_err() && !using_fallback_) {
        switch_to_fallback(result.error());
        return backend_->remove(name);
    }
    return result;
}

Result<void> SecretManager::store_seed_phrase(const std::string& id, const std::string& mnemonic) {
    bytes secret(mnemonic.begin(), mnemonic.end());
    auto result = store(SEED_PREFIX + id, secret);
    sodium_memzero(secret.data(), secret.size());
    return result;
}

Result<std::optional<std::string>> SecretManager::retrieve_seed_phrase(const std::string& id) {
    using R = Result<std::optional<std::string>>;
    ZULU_TRY_UNWRAP(secret, retrieve(SEED_PREFIX + id));
    if (!secret) {
        return R::Ok(std::nullopt);
    }
    std::string mnemonic(secret->begin(), secret->end());
    sodium_memzero(secret->data(), secret->size());
    return R::Ok(std::move(mnemonic));
}

Result<bool> SecretManager::delete_seed_phrase(const std::string& id) {
    return remove(SEED_PREFIX + id);
}

Result<void> SecretManager::store_private_key(const std::string& id, const SecretKey& key) {
    bytes secret(key.begin(), key.end());
    auto result = store(PRIVATE_KEY_PREFIX + id, secret);
    sodium_memzero(secret.data(), secret.size());
    return result;
}

Result<std::optional<SecretKey>> SecretManager::retrieve_private_key(const std::string& id) {
    using R = Result<std::optional<SecretKey>>;
    ZULU_TRY_UNWRAP(secret, retrieve(PRIVATE_KEY_PREFIX + id));
    if (!secret) {
        return R::Ok(std::nullopt);
    }
    if (secret->size() != constants::ED25519_SECRET_KEY_SIZE) {
        sodium_memzero(secret->data(), secret->size());
        return R::Err(ErrorCode::InvalidSecretKey, "Stored private key has wrong length: " + id);
    }
    SecretKey key;
    std::copy(secret->begin(), secret->end(), key.begin());
    sodium_memzero(secret->data(), secret->size());
    return R::Ok(key);
}

Result<bool> SecretManager::delete_private_key(const std::string& id) {
    return remove(PRIVATE_KEY_PREFIX + id);
}

bool SecretManager::using_fallback() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return using_fallback_;
}

std::string SecretManager::backend_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->backend_name();
}

} // namespace zulu::storage
