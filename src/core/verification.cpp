#include "verification.hpp"
#include "chunking/commitment.hpp"
#include "utils/logger.hpp"
#include "zulu/time_utils.hpp"
#include <algorithm>
#include <cstdlib>

namespace zulu::core {

namespace {

Result<uint32_t> read_day_count(const utils::Config& config, const std::string& key, uint32_t fallback) {
    if (!config.has(key)) {
        return Result<uint32_t>::Ok(fallback);
    }
    auto days = config.get<uint32_t>(key);
    if (!days) {
        return Result<uint32_t>::Err(ErrorCode::InvalidArgument, key + " must be a non-negative integer");
    }
    return Result<uint32_t>::Ok(*days);
}

} // anonymous namespace

// SystemConfig

Result<SystemConfig> SystemConfig::from_config(const utils::Config& config) {
    using R = Result<SystemConfig>;
    SystemConfig sc;

    sc.data_dir = config.get_or<std::string>("data_dir", sc.data_dir.string());
    sc.temp_dir = config.get_or<std::string>("temp_dir", sc.temp_dir.string());

    if (auto passphrase = config.get<std::string>("passphrase")) {
        sc.passphrase = *passphrase;
    } else if (auto env = config.get<std::string>("passphrase_env")) {
        const char* value = std::getenv(env->c_str());
        if (!value) {
            return R::Err(ErrorCode::InvalidArgument, "Environment variable " + *env + " is not set");
        }
        sc.passphrase = value;
    }
    if (sc.passphrase.empty()) {
        return R::Err(ErrorCode::InvalidArgument, "A store passphrase is required (passphrase or passphrase_env)");
    }

    auto policy_name = config.get_or<std::string>("trust_policy", "WARN");
    auto policy = trust::trust_policy_from_string(policy_name);
    if (!policy) {
        return R::Err(ErrorCode::InvalidArgument, "Unknown trust policy: " + policy_name);
    }
    sc.trust.policy = *policy;
    ZULU_TRY_UNWRAP(warning_days, read_day_count(config, "expiry_warning_days", sc.trust.expiry_warning_days));
    ZULU_TRY_UNWRAP(team_days, read_day_count(config, "team_key_lifetime_days", sc.trust.team_key_lifetime_days));
    ZULU_TRY_UNWRAP(user_days, read_day_count(config, "user_key_lifetime_days", sc.trust.user_key_lifetime_days));
    sc.trust.expiry_warning_days = warning_days;
    sc.trust.team_key_lifetime_days = team_days;
    sc.trust.user_key_lifetime_days = user_days;

    for (const auto& hex : config.get_or<std::vector<std::string>>("team_keys", {})) {
        auto key = fixed_from_hex<32>(hex);
        if (!key) {
            return R::Err(ErrorCode::InvalidPublicKey, "Invalid team key: " + hex);
        }
        sc.team_keys.push_back(*key);
    }

    sc.prefer_native_secret_store = config.get_or<bool>("prefer_native_secret_store", true);
    sc.resumable = config.get_or<bool>("resumable", true);
    sc.log_level = config.get_or<std::string>("log_level", "info");
    sc.kdf = crypto::Argon2::Params::from_name(config.get_or<std::string>("kdf", "interactive"));

    return R::Ok(std::move(sc));
}

// VerificationSystem

VerificationSystem::VerificationSystem(SystemConfig config,
                                       std::shared_ptr<storage::EncryptedStore> store,
                                       trust::TrustPolicyEngine::Clock clock)
    : config_(std::move(config))
    , store_(std::move(store))
    , receipts_(std::make_unique<storage::ReceiptStore>(store_))
    , secrets_(std::make_unique<storage::SecretManager>(store_, config_.prefer_native_secret_store))
    , trust_(std::make_unique<trust::TrustPolicyEngine>(config_.trust, receipts_.get(), std::move(clock)))
{}

VerificationSystem::~VerificationSystem() = default;

Result<std::unique_ptr<VerificationSystem>> VerificationSystem::create(
    const SystemConfig& config,
    trust::TrustPolicyEngine::Clock clock
) {
    using R = Result<std::unique_ptr<VerificationSystem>>;
    utils::Logger::set_level(config.log_level);

    ZULU_TRY_UNWRAP(store, storage::EncryptedStore::open_with_passphrase(
        config.data_dir, config.passphrase, config.kdf));
    auto shared_store = std::make_shared<storage::EncryptedStore>(std::move(store));

    std::unique_ptr<VerificationSystem> system(
        new VerificationSystem(config, std::move(shared_store), std::move(clock)));

    ZULU_TRY(system->trust_->restore_from_store());

    auto known = system->trust_->state();
    for (const auto& key : config.team_keys) {
        if (std::find(known.team_keys.begin(), known.team_keys.end(), key) != known.team_keys.end()) {
            continue;  // keep the recorded issuance time
        }
        ZULU_TRY(system->trust_->add_team_key(key));
    }

    ZULU_LOG_INFO("Verification system ready (policy {}, secrets via {})",
                  trust::trust_policy_to_string(system->trust_->policy()),
                  system->secrets_->backend_name());
    return R::Ok(std::move(system));
}

void VerificationSystem::log_outcome(const std::string& type, const std::string& subject_id, bool success,
                                     const Hash256* root, const PublicKey* signer,
                                     const std::optional<Error>& error) {
    storage::VerificationLogEntry entry;
    entry.verification_type = type;
    entry.subject_id = subject_id;
    entry.success = success;
    if (root) entry.root = hash_to_hex(*root);
    if (signer) entry.signer = to_hex(*signer);
    if (error) entry.error = error->to_string();

    auto logged = receipts_->log_verification(entry);
    if (logged.is_err()) {
        ZULU_LOG_WARN("Failed to record verification of {}: {}", subject_id, logged.error().to_string());
    }
}

Result<trust::TrustDecision> VerificationSystem::verify_manifest(const artifacts::Manifest& manifest) const {
    if (!manifest.verify_signature()) {
        return Result<trust::TrustDecision>::Err(ErrorCode::ManifestSignatureError,
                                                 "Invalid manifest signature for " + manifest.artifact_id);
    }
    return trust_->enforce(manifest.publisher.pubkey);
}

VerificationOutcome VerificationSystem::verify_artifact(
    const artifacts::Manifest& manifest,
    const download::FetchChunk& fetch,
    const std::filesystem::path& output_path,
    const keys::KeyPair* receipt_signer,
    const std::atomic<bool>* cancel
) {
    VerificationOutcome outcome;
    outcome.root = manifest.root;

    auto fail = [&](const Error& error) {
        outcome.error = error;
        log_outcome("artifact", manifest.artifact_id, false, &manifest.root, &manifest.publisher.pubkey, error);
        return outcome;
    };

    // 1-2. Signature and trust
    auto decision = verify_manifest(manifest);
    if (decision.is_err()) {
        ZULU_LOG_ERROR("Rejected manifest {}: {}", manifest.artifact_id, decision.error().to_string());
        return fail(decision.error());
    }
    outcome.trust = decision.value();

    // 3. Streaming download
    download::DownloadOptions options;
    options.temp_dir = config_.temp_dir;
    options.resumable = config_.resumable;
    options.cancel = cancel;
    options.on_chunk_verified = [](uint32_t current, uint32_t total) {
        if (current % 10 == 0 || current == total) {
            ZULU_LOG_DEBUG("Verified {}/{} chunks", current, total);
        }
    };

    download::StreamingDownloader downloader(manifest, options);
    outcome.download = downloader.download(fetch, output_path);
    if (!outcome.download->success) {
        return fail(*outcome.download->error);
    }

    // 4. Receipt
    if (receipt_signer) {
        auto metadata = artifacts::Receipts::artifact_metadata(
            manifest.artifact_type, manifest.metadata.size, manifest.metadata.chunk_count, manifest.strategy);
        metadata["publisher"] = manifest.publisher.name;
        metadata["publisherPubkey"] = to_hex(manifest.publisher.pubkey);

        auto receipt = artifacts::Receipts::create_artifact_receipt(
            manifest.artifact_id, manifest.artifact_version, manifest.root, *receipt_signer, metadata);
        auto stored = receipts_->store_receipt(receipt);
        if (stored.is_err()) {
            return fail(stored.error());
        }
        outcome.receipt = std::move(receipt);
    }

    outcome.success = true;
    log_outcome("artifact", manifest.artifact_id, true, &manifest.root, &manifest.publisher.pubkey, std::nullopt);
    return outcome;
}

VerificationOutcome VerificationSystem::verify_artifact_file(
    const artifacts::Manifest& manifest,
    const std::filesystem::path& source_path,
    const std::filesystem::path& output_path,
    const keys::KeyPair* receipt_signer
) {
    auto source = download::FileChunkSource::open(source_path, manifest.metadata.chunk_size);
    if (source.is_err()) {
        VerificationOutcome outcome;
        outcome.root = manifest.root;
        outcome.error = source.error();
        log_outcome("artifact", manifest.artifact_id, false, &manifest.root, &manifest.publisher.pubkey,
                    outcome.error);
        return outcome;
    }
    return verify_artifact(manifest, source.value().fetcher(), output_path, receipt_signer);
}

CollaboratorResult VerificationSystem::verify_plugin_package(const artifacts::Manifest& manifest) {
    CollaboratorResult result;
    result.root = manifest.root;

    if (manifest.artifact_type != chunking::ArtifactType::Plugin) {
        result.error = Error(ErrorCode::ManifestInvalid, "Manifest does not describe a plugin");
    } else {
        auto decision = verify_manifest(manifest);
        if (decision.is_err()) {
            result.error = decision.error();
        } else {
            result.success = true;
        }
    }

    log_outcome("plugin", manifest.artifact_id, result.success, &manifest.root, &manifest.publisher.pubkey,
                result.error);
    return result;
}

CollaboratorResult VerificationSystem::commit_session_bundle(
    const std::string& session_id,
    const bytes& bundle,
    const keys::KeyPair& signer
) {
    CollaboratorResult result;

    auto commitment = chunking::Commitment::create_for_buffer(bundle, chunking::ArtifactType::Memory);
    if (commitment.is_err()) {
        result.error = commitment.error();
        log_outcome("session", session_id, false, nullptr, &signer.public_key(), result.error);
        return result;
    }
    result.root = commitment.value().root;

    nlohmann::json metadata = {
        {"bundleSize", bundle.size()},
        {"chunkCount", commitment.value().metadata.chunk_count},
        {"strategy", chunking::strategy_to_string(commitment.value().strategy)}
    };
    auto receipt = artifacts::Receipts::create_session_receipt(session_id, result.root, signer, metadata);
    auto stored = receipts_->store_receipt(receipt);
    if (stored.is_err()) {
        result.error = stored.error();
    } else {
        result.success = true;
        result.receipt_hash = receipt.receipt_hash;
    }

    log_outcome("session", session_id, result.success, &result.root, &signer.public_key(), result.error);
    return result;
}

Result<storage::StoreOutcome> VerificationSystem::store_receipt(const artifacts::Receipt& receipt) {
    return receipts_->store_receipt(receipt);
}

Result<std::optional<artifacts::Receipt>> VerificationSystem::get_receipt(const std::string& receipt_hash) const {
    return receipts_->get_receipt(receipt_hash);
}

Result<void> VerificationSystem::approve_key(const PublicKey& pubkey) {
    return trust_->approve_key(pubkey);
}

Result<void> VerificationSystem::revoke_key(const PublicKey& pubkey, const std::string& reason) {
    return trust_->revoke_key(pubkey, reason);
}

std::vector<trust::ExpiringKey> VerificationSystem::expiring_keys(uint32_t within_days) const {
    return trust_->expiring_keys(within_days);
}

void VerificationSystem::set_trust_policy(trust::TrustPolicy policy) {
    trust_->set_policy(policy);
}

} // namespace zulu::core
