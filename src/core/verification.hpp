#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include "artifacts/manifest.hpp"
#include "artifacts/receipt.hpp"
#include "crypto/argon2.hpp"
#include "download/downloader.hpp"
#include "keys/key_pair.hpp"
#include "storage/encrypted_store.hpp"
#include "storage/receipt_store.hpp"
#include "storage/secret_store.hpp"
#include "trust/trust_policy.hpp"
#include "utils/config.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zulu::core {

/**
 * Settings for a VerificationSystem, usually read from a JSON config
 */
struct SystemConfig {
    std::filesystem::path data_dir = "./zulu-data";
    std::filesystem::path temp_dir = "./temp";
    std::string passphrase;
    trust::TrustConfig trust;
    std::vector<PublicKey> team_keys;
    bool prefer_native_secret_store = true;
    bool resumable = true;
    std::string log_level = "info";
    crypto::Argon2::Params kdf = crypto::Argon2::Params::interactive();

    /**
     * Keys: data_dir, temp_dir, passphrase or passphrase_env, trust_policy,
     * team_keys, expiry_warning_days, team_key_lifetime_days,
     * user_key_lifetime_days, prefer_native_secret_store, resumable,
     * log_level, kdf
     */
    static Result<SystemConfig> from_config(const utils::Config& config);
};

/**
 * Result of a full artifact verification
 */
struct VerificationOutcome {
    bool success = false;
    Hash256 root{};
    std::optional<Error> error;
    std::optional<trust::TrustDecision> trust;
    std::optional<download::DownloadResult> download;
    std::optional<artifacts::Receipt> receipt;
};

/**
 * Result handed to plugin and memory-export callers
 */
struct CollaboratorResult {
    bool success = false;
    Hash256 root{};
    std::optional<Error> error;
    std::string receipt_hash;  // set for committed sessions
};

/**
 * VerificationSystem - signature, trust, download and receipt pipeline
 */
class VerificationSystem {
public:
    static Result<std::unique_ptr<VerificationSystem>> create(
        const SystemConfig& config,
        trust::TrustPolicyEngine::Clock clock = {}
    );

    ~VerificationSystem();

    VerificationSystem(const VerificationSystem&) = delete;
    VerificationSystem& operator=(const VerificationSystem&) = delete;

    /**
     * Check the manifest signature, then the signer's trust
     */
    Result<trust::TrustDecision> verify_manifest(const artifacts::Manifest& manifest) const;

    /**
     * Signature, trust, streaming download to output_path, audit log entry.
     * With a receipt signer, a receipt for the verified root is created and
     * stored.
     */
    VerificationOutcome verify_artifact(
        const artifacts::Manifest& manifest,
        const download::FetchChunk& fetch,
        const std::filesystem::path& output_path,
        const keys::KeyPair* receipt_signer = nullptr,
        const std::atomic<bool>* cancel = nullptr
    );

    /**
     * verify_artifact with chunks read from a local copy of the artifact
     */
    VerificationOutcome verify_artifact_file(
        const artifacts::Manifest& manifest,
        const std::filesystem::path& source_path,
        const std::filesystem::path& output_path,
        const keys::KeyPair* receipt_signer = nullptr
    );

    /**
     * Gate for plugin installation: signature and trust only
     */
    CollaboratorResult verify_plugin_package(const artifacts::Manifest& manifest);

    /**
     * Commit a memory-export session bundle: compute its root, sign and
     * store a session receipt
     */
    CollaboratorResult commit_session_bundle(
        const std::string& session_id,
        const bytes& bundle,
        const keys::KeyPair& signer
    );

    Result<storage::StoreOutcome> store_receipt(const artifacts::Receipt& receipt);
    Result<std::optional<artifacts::Receipt>> get_receipt(const std::string& receipt_hash) const;

    // Key lifecycle
    Result<void> approve_key(const PublicKey& pubkey);
    Result<void> revoke_key(const PublicKey& pubkey, const std::string& reason);
    std::vector<trust::ExpiringKey> expiring_keys(uint32_t within_days) const;
    void set_trust_policy(trust::TrustPolicy policy);

    trust::TrustPolicyEngine& trust_engine() { return *trust_; }
    storage::ReceiptStore& receipt_store() { return *receipts_; }
    storage::SecretManager& secrets() { return *secrets_; }

private:
    VerificationSystem(SystemConfig config,
                       std::shared_ptr<storage::EncryptedStore> store,
                       trust::TrustPolicyEngine::Clock clock);

    void log_outcome(const std::string& type, const std::string& subject_id, bool success,
                     const Hash256* root, const PublicKey* signer, const std::optional<Error>& error);

    SystemConfig config_;
    std::shared_ptr<storage::EncryptedStore> store_;
    std::unique_ptr<storage::ReceiptStore> receipts_;
    std::unique_ptr<storage::SecretManager> secrets_;
    std::unique_ptr<trust::TrustPolicyEngine> trust_;
};

} // namespace zulu::core
