#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include "storage/encrypted_store.hpp"
#include "artifacts/receipt.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zulu::storage {

enum class StoreOutcome {
    Inserted,
    AlreadyPresent
};

enum class KeyType {
    Team,
    User
};

const char* key_type_to_string(KeyType type);
std::optional<KeyType> key_type_from_string(const std::string& str);

/**
 * Persisted lifecycle record for a signer key
 */
struct KeyMetadata {
    std::string key_id;              // hex public key
    KeyType type = KeyType::User;
    PublicKey pubkey{};
    uint64_t created_at = 0;         // Unix seconds
    uint64_t expires_at = 0;         // Unix seconds
    bool revoked = false;
    std::optional<uint64_t> revoked_at;
    std::string revocation_reason;
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json to_json() const;
    static Result<KeyMetadata> from_json(const nlohmann::json& j);
};

/**
 * One line of the verification audit log
 */
struct VerificationLogEntry {
    std::string verification_type;   // "artifact", "plugin", "session", ...
    std::string subject_id;
    bool success = false;
    std::string root;                // hex, empty when unknown
    std::string signer;              // hex, empty when unknown
    std::string error;
    uint64_t timestamp_ms = 0;

    nlohmann::json to_json() const;
    static Result<VerificationLogEntry> from_json(const nlohmann::json& j);
};

/**
 * Receipts, key metadata and the verification log, kept in an
 * EncryptedStore. Writes are serialized; reads run concurrently.
 */
class ReceiptStore {
public:
    explicit ReceiptStore(std::shared_ptr<EncryptedStore> store);

    /**
     * Store a receipt after verifying its signature and hash.
     * Re-storing identical content is a no-op; the same hash with
     * different content fails with ReceiptCollision.
     */
    Result<StoreOutcome> store_receipt(const artifacts::Receipt& receipt);

    Result<std::optional<artifacts::Receipt>> get_receipt(const std::string& receipt_hash) const;

    Result<std::vector<artifacts::Receipt>> receipts_for_subject(const std::string& subject_id) const;

    // Key metadata
    Result<void> store_key_metadata(const KeyMetadata& metadata);
    Result<std::optional<KeyMetadata>> get_key_metadata(const PublicKey& pubkey) const;
    Result<void> mark_key_revoked(const PublicKey& pubkey, uint64_t revoked_at, const std::string& reason);

    /**
     * Non-revoked keys whose expiry falls within [now, now + within_days],
     * soonest first
     */
    Result<std::vector<KeyMetadata>> query_expiring_keys(uint32_t within_days, uint64_t now) const;

    Result<std::vector<KeyMetadata>> all_key_metadata() const;

    // Verification log
    Result<void> log_verification(const VerificationLogEntry& entry);

    /**
     * Log entries, newest first. Empty filters match everything; limit 0
     * means unlimited.
     */
    Result<std::vector<VerificationLogEntry>> verification_logs(
        const std::string& verification_type = "",
        const std::string& subject_id = "",
        size_t limit = 0
    ) const;

    const std::shared_ptr<EncryptedStore>& store() const { return store_; }

private:
    std::shared_ptr<EncryptedStore> store_;
    std::mutex write_mutex_;
};

} // namespace zulu::storage
