#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace zulu::storage {
class ReceiptStore;
}

namespace zulu::trust {

/**
 * TrustPolicy - How signers outside the team keyring are treated
 */
enum class TrustPolicy {
    Strict,      // Team keys only
    Warn,        // Team keys, plus user-approved keys with a warning
    BestEffort   // Any key that is neither revoked nor expired, always with a warning
};

const char* trust_policy_to_string(TrustPolicy policy);
std::optional<TrustPolicy> trust_policy_from_string(const std::string& str);

enum class KeyStatus {
    Unknown,
    Approved,
    Team,
    Revoked,
    Expired
};

const char* key_status_to_string(KeyStatus status);

struct TrustConfig {
    TrustPolicy policy = TrustPolicy::Warn;
    uint32_t expiry_warning_days = constants::DEFAULT_EXPIRY_WARNING_DAYS;
    uint32_t team_key_lifetime_days = constants::TEAM_KEY_LIFETIME_DAYS;
    uint32_t user_key_lifetime_days = constants::USER_KEY_LIFETIME_DAYS;
};

struct TrustDecision {
    bool trusted = false;
    KeyStatus status = KeyStatus::Unknown;
    bool warning = false;
    std::string reason;
    std::string warning_message;
    std::optional<ErrorCode> error_code;     // set when not trusted
    std::optional<uint64_t> expires_at;      // Unix seconds, when the key has a lifetime
};

/**
 * Snapshot of the engine state
 */
struct TrustPolicyState {
    TrustPolicy policy = TrustPolicy::Warn;
    std::vector<PublicKey> team_keys;
    std::vector<PublicKey> approved_keys;
    std::vector<PublicKey> revoked_keys;
    uint32_t expiry_warning_days = constants::DEFAULT_EXPIRY_WARNING_DAYS;
};

struct ExpiringKey {
    PublicKey pubkey{};
    KeyStatus status = KeyStatus::Unknown;
    uint64_t expires_at = 0;
    uint32_t days_remaining = 0;
};

/**
 * TrustPolicyEngine - decides whether a signer key is acceptable
 *
 * Checks run in a fixed order: revocation, then expiration, then policy.
 * Revocation is terminal; approval cannot undo it. Expiration is computed
 * from the issuance time on every check against the injected clock.
 *
 * Checks take a shared lock and mutations an exclusive one, so a check
 * never sees a half-applied revocation. When a ReceiptStore is attached,
 * key lifecycle changes are mirrored into it.
 */
class TrustPolicyEngine {
public:
    using Clock = std::function<uint64_t()>;

    explicit TrustPolicyEngine(TrustConfig config = {},
                               storage::ReceiptStore* store = nullptr,
                               Clock clock = {});

    /**
     * Load team, approved and revoked keys from the attached store
     */
    Result<void> restore_from_store();

    TrustDecision verify_key_trust(const PublicKey& pubkey) const;

    /**
     * verify_key_trust, with an untrusted decision turned into
     * KeyRevoked, KeyExpired or UntrustedSigner
     */
    Result<TrustDecision> enforce(const PublicKey& pubkey) const;

    /**
     * Unknown -> Approved. Idempotent; fails with KeyRevoked for a revoked key.
     */
    Result<void> approve_key(const PublicKey& pubkey);

    /**
     * Any state -> Revoked
     */
    Result<void> revoke_key(const PublicKey& pubkey, const std::string& reason);

    Result<void> add_team_key(const PublicKey& pubkey, std::optional<uint64_t> issued_at = std::nullopt);

    /**
     * Team and approved keys expiring within the given number of days,
     * soonest first
     */
    std::vector<ExpiringKey> expiring_keys(uint32_t within_days) const;

    bool is_revoked(const PublicKey& pubkey) const;
    KeyStatus status_of(const PublicKey& pubkey) const;

    void set_policy(TrustPolicy policy);
    TrustPolicy policy() const;

    TrustPolicyState state() const;

private:
    struct Revocation {
        uint64_t revoked_at;
        std::string reason;
    };

    // Callers hold mutex_
    std::optional<uint64_t> expires_at_locked(const PublicKey& pubkey) const;
    KeyStatus status_locked(const PublicKey& pubkey, uint64_t now) const;

    TrustConfig config_;
    storage::ReceiptStore* store_;
    Clock clock_;

    std::map<PublicKey, uint64_t> team_keys_;       // pubkey -> issued_at
    std::map<PublicKey, uint64_t> approved_keys_;   // pubkey -> issued_at
    std::map<PublicKey, Revocation> revoked_;

    mutable std::shared_mutex mutex_;
};

} // namespace zulu::trust
