#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include "crypto/argon2.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zulu::storage {

/**
 * Encrypted-at-rest table store.
 *
 * Layout under the data directory:
 *   store.json          salt and KDF parameters (passphrase mode)
 *   store.verifier      known plaintext sealed under the master key
 *   <table>/<hex(key)>.rec   nonce(12) || ChaCha20-Poly1305(value)
 *
 * The AEAD additional data binds each record to "table/key", so a record
 * copied to another key fails authentication. Record writes go through a
 * temp file, fsync and rename. Reads take a shared lock, writes an
 * exclusive one.
 */
class EncryptedStore {
public:
    static constexpr size_t MAX_KEY_LENGTH = 120;

    /**
     * Open (or create) a store whose master key is derived from a passphrase
     * with Argon2id. Parameters are recorded on creation and reused on open.
     * A wrong passphrase fails with StorageAuthenticationFailed.
     */
    static Result<EncryptedStore> open_with_passphrase(
        const std::filesystem::path& data_dir,
        const std::string& passphrase,
        const crypto::Argon2::Params& params = crypto::Argon2::Params::interactive()
    );

    /**
     * Open (or create) a store with a raw 32-byte master key
     */
    static Result<EncryptedStore> open_with_key(
        const std::filesystem::path& data_dir,
        const SessionKey& master_key
    );

    ~EncryptedStore();

    EncryptedStore(const EncryptedStore&) = delete;
    EncryptedStore& operator=(const EncryptedStore&) = delete;
    EncryptedStore(EncryptedStore&&) noexcept;
    EncryptedStore& operator=(EncryptedStore&&) noexcept;

    /**
     * Insert or replace a record
     */
    Result<void> put(const std::string& table, const std::string& key, const bytes& value);

    /**
     * Fetch a record. nullopt when absent; an error when present but
     * unreadable or failing authentication.
     */
    Result<std::optional<bytes>> get(const std::string& table, const std::string& key) const;

    /**
     * Delete a record. Returns whether a record existed.
     */
    Result<bool> remove(const std::string& table, const std::string& key);

    /**
     * Keys of a table in lexicographic order
     */
    Result<std::vector<std::string>> list(const std::string& table) const;

    bool contains(const std::string& table, const std::string& key) const;

    const std::filesystem::path& data_dir() const;

private:
    class Impl;
    explicit EncryptedStore(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace zulu::storage
