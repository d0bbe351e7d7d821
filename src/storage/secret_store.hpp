#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include "storage/encrypted_store.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zulu::storage {

/**
 * SecretStore - capability interface for holding seed phrases and keys
 *
 * Implementations:
 *   KernelKeyringSecretStore  Linux kernel user keyring (keyctl)
 *   EncryptedSecretStore      EncryptedStore table "secrets"
 */
class SecretStore {
public:
    virtual ~SecretStore() = default;

    virtual Result<void> store(const std::string& name, const bytes& secret) = 0;

    /**
     * nullopt when no secret exists under the name
     */
    virtual Result<std::optional<bytes>> retrieve(const std::string& name) = 0;

    /**
     * Returns whether a secret existed
     */
    virtual Result<bool> remove(const std::string& name) = 0;

    virtual Result<std::vector<std::string>> list() = 0;

    virtual std::string backend_name() const = 0;

    /**
     * Check that the backend works on this system
     */
    virtual bool is_available() const = 0;
};

/**
 * Secrets in the calling user's kernel keyring as "user" keys named
 * "zulu.verification:<name>". Linux only; elsewhere is_available() is false
 * and every operation fails with SecretStoreUnavailable.
 */
class KernelKeyringSecretStore : public SecretStore {
public:
    static constexpr const char* DESCRIPTION_PREFIX = "zulu.verification:";

    Result<void> store(const std::string& name, const bytes& secret) override;
    Result<std::optional<bytes>> retrieve(const std::string& name) override;
    Result<bool> remove(const std::string& name) override;
    Result<std::vector<std::string>> list() override;
    std::string backend_name() const override { return "kernel-keyring"; }
    bool is_available() const override;
};

class EncryptedSecretStore : public SecretStore {
public:
    explicit EncryptedSecretStore(std::shared_ptr<EncryptedStore> store);

    Result<void> store(const std::string& name, const bytes& secret) override;
    Result<std::optional<bytes>> retrieve(const std::string& name) override;
    Result<bool> remove(const std::string& name) override;
    Result<std::vector<std::string>> list() override;
    std::string backend_name() const override { return "encrypted-file"; }
    bool is_available() const override { return store_ != nullptr; }

private:
    std::shared_ptr<EncryptedStore> store_;
};

class SecretStoreFactory {
public:
    /**
     * Pick the native keyring when requested and working, else the
     * encrypted-file fallback
     */
    static std::unique_ptr<SecretStore> create(std::shared_ptr<EncryptedStore> fallback,
                                               bool prefer_native = true);
};

/**
 * SecretManager - seed phrase and private key custody
 *
 * Uses the selected backend and switches to the encrypted-file store for
 * good when the native backend fails an operation.
 */
class SecretManager {
public:
    SecretManager(std::shared_ptr<EncryptedStore> fallback, bool prefer_native = true);

    Result<void> store_seed_phrase(const std::string& id, const std::string& mnemonic);
    Result<std::optional<std::string>> retrieve_seed_phrase(const std::string& id);
    Result<bool> delete_seed_phrase(const std::string& id);

    Result<void> store_private_key(const std::string& id, const SecretKey& key);
    Result<std::optional<SecretKey>> retrieve_private_key(const std::string& id);
    Result<bool> delete_private_key(const std::string& id);

    bool using_fallback() const;
    std::string backend_name() const;

private:
    Result<void> store(const std::string& name, const bytes& secret);
    Result<std::optional<bytes>> retrieve(const std::string& name);
    Result<bool> remove(const std::string& name);

    void switch_to_fallback(const Error& cause);

    std::shared_ptr<EncryptedStore> fallback_store_;
    std::unique_ptr<SecretStore> backend_;
    bool using_fallback_ = false;
    mutable std::mutex mutex_;
};

} // namespace zulu::storage
