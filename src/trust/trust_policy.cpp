#include "trust_policy.hpp"
#include "storage/receipt_store.hpp"
#include "utils/logger.hpp"
#include "zulu/time_utils.hpp"
#include <algorithm>
#include <mutex>

namespace zulu::trust {

namespace {

std::string short_id(const PublicKey& pubkey) {
    return to_hex(pubkey).substr(0, 16);
}

void append_message(std::string& target, const std::string& message) {
    if (!target.empty()) {
        target += "; ";
    }
    target += message;
}

} // anonymous namespace

const char* trust_policy_to_string(TrustPolicy policy) {
    switch (policy) {
        case TrustPolicy::Strict: return "STRICT";
        case TrustPolicy::Warn: return "WARN";
        case TrustPolicy::BestEffort: return "BEST_EFFORT";
    }
    return "WARN";
}

std::optional<TrustPolicy> trust_policy_from_string(const std::string& str) {
    if (str == "STRICT") return TrustPolicy::Strict;
    if (str == "WARN") return TrustPolicy::Warn;
    if (str == "BEST_EFFORT") return TrustPolicy::BestEffort;
    return std::nullopt;
}

const char* key_status_to_string(KeyStatus status) {
    switch (status) {
        case KeyStatus::Unknown: return "unknown";
        case KeyStatus::Approved: return "approved";
        case KeyStatus::Team: return "team";
        case KeyStatus::Revoked: return "revoked";
        case KeyStatus::Expired: return "expired";
    }
    return "unknown";
}

TrustPolicyEngine::TrustPolicyEngine(TrustConfig config, storage::ReceiptStore* store, Clock clock)
    : config_(config)
    , store_(store)
    , clock_(clock ? std::move(clock) : Clock([] { return time::timestamp_seconds(); }))
{}

Result<void> TrustPolicyEngine::restore_from_store() {
    if (!store_) {
        return Result<void>::Ok();
    }
    ZULU_TRY_UNWRAP(all, store_->all_key_metadata());

    std::unique_lock lock(mutex_);
    for (const auto& m : all) {
        if (m.revoked) {
            revoked_[m.pubkey] = Revocation{m.revoked_at.value_or(0), m.revocation_reason};
            approved_keys_.erase(m.pubkey);
            continue;
        }
        if (m.type == storage::KeyType::Team) {
            team_keys_[m.pubkey] = m.created_at;
        } else {
            approved_keys_[m.pubkey] = m.created_at;
        }
    }
    ZULU_LOG_INFO("Restored trust state: {} team, {} approved, {} revoked keys",
                  team_keys_.size(), approved_keys_.size(), revoked_.size());
    return Result<void>::Ok();
}

std::optional<uint64_t> TrustPolicyEngine::expires_at_locked(const PublicKey& pubkey) const {
    auto team = team_keys_.find(pubkey);
    if (team != team_keys_.end()) {
        return team->second + static_cast<uint64_t>(config_.team_key_lifetime_days) * constants::SECONDS_PER_DAY;
    }
    auto approved = approved_keys_.find(pubkey);
    if (approved != approved_keys_.end()) {
        return approved->second + static_cast<uint64_t>(config_.user_key_lifetime_days) * constants::SECONDS_PER_DAY;
    }
    return std::nullopt;
}

KeyStatus TrustPolicyEngine::status_locked(const PublicKey& pubkey, uint64_t now) const {
    if (revoked_.count(pubkey)) {
        return KeyStatus::Revoked;
    }
    auto expires_at = expires_at_locked(pubkey);
    if (expires_at && now >= *expires_at) {
        return KeyStatus::Expired;
    }
    if (team_keys_.count(pubkey)) {
        return KeyStatus::Team;
    }
    if (approved_keys_.count(pubkey)) {
        return KeyStatus::Approved;
    }
    return KeyStatus::Unknown;
}

TrustDecision TrustPolicyEngine::verify_key_trust(const PublicKey& pubkey) const {
    uint64_t now = clock_();
    std::shared_lock lock(mutex_);

    TrustDecision decision;

    // 1. Revocation wins over everything
    auto revoked = revoked_.find(pubkey);
    if (revoked != revoked_.end()) {
        decision.status = KeyStatus::Revoked;
        decision.reason = "Key revoked";
        if (!revoked->second.reason.empty()) {
            decision.reason += ": " + revoked->second.reason;
        }
        decision.error_code = ErrorCode::KeyRevoked;
        return decision;
    }

    // 2. Expiration, computed now
    decision.expires_at = expires_at_locked(pubkey);
    if (decision.expires_at && now >= *decision.expires_at) {
        decision.status = KeyStatus::Expired;
        decision.reason = "Key expired";
        decision.error_code = ErrorCode::KeyExpired;
        return decision;
    }

    // 3. Policy
    decision.status = status_locked(pubkey, now);
    switch (config_.policy) {
        case TrustPolicy::Strict:
            if (decision.status != KeyStatus::Team) {
                decision.reason = "Key is not in the team keyring (STRICT policy)";
                decision.error_code = ErrorCode::UntrustedSigner;
                return decision;
            }
            decision.trusted = true;
            decision.reason = "Team key";
            break;

        case TrustPolicy::Warn:
            if (decision.status == KeyStatus::Team) {
                decision.trusted = true;
                decision.reason = "Team key";
            } else if (decision.status == KeyStatus::Approved) {
                decision.trusted = true;
                decision.warning = true;
                decision.reason = "User-approved key";
                decision.warning_message = "Key is user-approved, not a team key";
            } else {
                decision.reason = "Unknown key; approve it to trust under WARN policy";
                decision.error_code = ErrorCode::UntrustedSigner;
                return decision;
            }
            break;

        case TrustPolicy::BestEffort:
            decision.trusted = true;
            decision.warning = true;
            if (decision.status == KeyStatus::Team) {
                decision.reason = "Team key";
                decision.warning_message = "Trust checks relaxed (BEST_EFFORT policy)";
            } else if (decision.status == KeyStatus::Approved) {
                decision.reason = "User-approved key";
                decision.warning_message = "Key is user-approved, not a team key";
            } else {
                decision.reason = "Unknown key accepted";
                decision.warning_message = "Unknown key accepted under BEST_EFFORT policy";
            }
            break;
    }

    // 4. Expiring soon
    if (decision.expires_at) {
        uint64_t remaining = *decision.expires_at - now;
        if (remaining <= static_cast<uint64_t>(config_.expiry_warning_days) * constants::SECONDS_PER_DAY) {
            decision.warning = true;
            append_message(decision.warning_message,
                           "Key expires in " + std::to_string(remaining / constants::SECONDS_PER_DAY) + " days");
        }
    }

    if (decision.warning) {
        ZULU_LOG_WARN("Trust warning for key {}: {}", short_id(pubkey), decision.warning_message);
    }
    return decision;
}

Result<TrustDecision> TrustPolicyEngine::enforce(const PublicKey& pubkey) const {
    TrustDecision decision = verify_key_trust(pubkey);
    if (!decision.trusted) {
        ErrorCode code = decision.error_code.value_or(ErrorCode::UntrustedSigner);
        return Result<TrustDecision>::Err(Error(code, decision.reason, to_hex(pubkey)));
    }
    return Result<TrustDecision>::Ok(std::move(decision));
}

Result<void> TrustPolicyEngine::approve_key(const PublicKey& pubkey) {
    uint64_t now = clock_();
    std::unique_lock lock(mutex_);

    if (revoked_.count(pubkey)) {
        return Result<void>::Err(ErrorCode::KeyRevoked, "Cannot approve revoked key " + short_id(pubkey));
    }
    if (approved_keys_.count(pubkey)) {
        return Result<void>::Ok();
    }
    // Team keys are already trusted; their stored record and lifetime stay as issued
    if (team_keys_.count(pubkey)) {
        ZULU_LOG_DEBUG("Key {} is a team key, approval not recorded", short_id(pubkey));
        return Result<void>::Ok();
    }

    if (store_) {
        storage::KeyMetadata metadata;
        metadata.key_id = to_hex(pubkey);
        metadata.type = storage::KeyType::User;
        metadata.pubkey = pubkey;
        metadata.created_at = now;
        metadata.expires_at = now + static_cast<uint64_t>(config_.user_key_lifetime_days) * constants::SECONDS_PER_DAY;
        metadata.metadata = {{"approvedBy", "user"}};
        ZULU_TRY(store_->store_key_metadata(metadata));
    }

    approved_keys_[pubkey] = now;
    ZULU_LOG_INFO("Approved key {}", short_id(pubkey));
    return Result<void>::Ok();
}

Result<void> TrustPolicyEngine::revoke_key(const PublicKey& pubkey, const std::string& reason) {
    uint64_t now = clock_();
    std::unique_lock lock(mutex_);

    bool was_team = team_keys_.count(pubkey) > 0;
    revoked_[pubkey] = Revocation{now, reason};
    approved_keys_.erase(pubkey);
    ZULU_LOG_INFO("Revoked key {}: {}", short_id(pubkey), reason);

    if (!store_) {
        return Result<void>::Ok();
    }

    auto marked = store_->mark_key_revoked(pubkey, now, reason);
    if (marked.is_ok()) {
        return marked;
    }
    if (marked.error().code() != ErrorCode::StorageNotFound) {
        return marked;
    }

    // No metadata yet: record the revocation on its own
    storage::KeyMetadata metadata;
    metadata.key_id = to_hex(pubkey);
    metadata.type = was_team ? storage::KeyType::Team : storage::KeyType::User;
    metadata.pubkey = pubkey;
    metadata.created_at = now;
    metadata.expires_at = now;
    metadata.revoked = true;
    metadata.revoked_at = now;
    metadata.revocation_reason = reason;
    return store_->store_key_metadata(metadata);
}

Result<void> TrustPolicyEngine::add_team_key(const PublicKey& pubkey, std::optional<uint64_t> issued_at) {
    uint64_t issued = issued_at.value_or(clock_());
    std::unique_lock lock(mutex_);

    if (store_) {
        storage::KeyMetadata metadata;
        metadata.key_id = to_hex(pubkey);
        metadata.type = storage::KeyType::Team;
        metadata.pubkey = pubkey;
        metadata.created_at = issued;
        metadata.expires_at = issued + static_cast<uint64_t>(config_.team_key_lifetime_days) * constants::SECONDS_PER_DAY;
        auto revoked = revoked_.find(pubkey);
        if (revoked != revoked_.end()) {
            metadata.revoked = true;
            metadata.revoked_at = revoked->second.revoked_at;
            metadata.revocation_reason = revoked->second.reason;
        }
        metadata.metadata = {{"source", "team_keyring"}};
        ZULU_TRY(store_->store_key_metadata(metadata));
    }

    team_keys_[pubkey] = issued;
    ZULU_LOG_DEBUG("Added team key {}", short_id(pubkey));
    return Result<void>::Ok();
}

std::vector<ExpiringKey> TrustPolicyEngine::expiring_keys(uint32_t within_days) const {
    uint64_t now = clock_();
    uint64_t horizon = now + static_cast<uint64_t>(within_days) * constants::SECONDS_PER_DAY;
    std::shared_lock lock(mutex_);

    std::vector<ExpiringKey> expiring;
    auto collect = [&](const std::map<PublicKey, uint64_t>& keys) {
        for (const auto& [pubkey, issued] : keys) {
            ZULU_UNUSED(issued);
            KeyStatus status = status_locked(pubkey, now);
            if (status != KeyStatus::Team && status != KeyStatus::Approved) continue;
            // A team entry shadows an approval of the same key
            if (&keys == &approved_keys_ && team_keys_.count(pubkey)) continue;

            uint64_t expires_at = *expires_at_locked(pubkey);
            if (expires_at > horizon) continue;
            expiring.push_back(ExpiringKey{
                pubkey, status, expires_at,
                static_cast<uint32_t>((expires_at - now) / constants::SECONDS_PER_DAY)
            });
        }
    };
    collect(team_keys_);
    collect(approved_keys_);

    std::sort(expiring.begin(), expiring.end(), [](const auto& a, const auto& b) {
        return a.expires_at < b.expires_at;
    });
    return expiring;
}

bool TrustPolicyEngine::is_revoked(const PublicKey& pubkey) const {
    std::shared_lock lock(mutex_);
    return revoked_.count(pubkey) > 0;
}

KeyStatus TrustPolicyEngine::status_of(const PublicKey& pubkey) const {
    uint64_t now = clock_();
    std::shared_lock lock(mutex_);
    return status_locked(pubkey, now);
}

void TrustPolicyEngine::set_policy(TrustPolicy policy) {
    std::unique_lock lock(mutex_);
    if (config_.policy != policy) {
        ZULU_LOG_INFO("Trust policy changed: {} -> {}", trust_policy_to_string(config_.policy),
                      trust_policy_to_string(policy));
    }
    config_.policy = policy;
}

TrustPolicy TrustPolicyEngine::policy() const {
    std::shared_lock lock(mutex_);
    return config_.policy;
}

TrustPolicyState TrustPolicyEngine::state() const {
    std::shared_lock lock(mutex_);
    TrustPolicyState state;
    state.policy = config_.policy;
    state.expiry_warning_days = config_.expiry_warning_days;
    for (const auto& entry : team_keys_) state.team_keys.push_back(entry.first);
    for (const auto& entry : approved_keys_) state.approved_keys.push_back(entry.first);
    for (const auto& entry : revoked_) state.revoked_keys.push_back(entry.first);
    return state;
}

} // namespace zulu::trust
