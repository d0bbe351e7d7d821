#include "receipt_store.hpp"
#include "crypto/random.hpp"
#include "utils/logger.hpp"
#include "zulu/time_utils.hpp"
#include <algorithm>
#include <cstdio>

namespace zulu::storage {

using json = nlohmann::json;

namespace {

const char* RECEIPTS_TABLE = "receipts";
const char* KEY_METADATA_TABLE = "key_metadata";
const char* VERIFICATION_LOG_TABLE = "verification_log";

bytes encode(const json& j) {
    std::string s = j.dump();
    return bytes(s.begin(), s.end());
}

Result<json> decode(const bytes& data) {
    try {
        return Result<json>::Ok(json::parse(data.begin(), data.end()));
    } catch (const json::parse_error& e) {
        return Result<json>::Err(Error(ErrorCode::StorageCorrupted, "Stored record is not valid JSON", e.what()));
    }
}

// Fixed-width millisecond prefix keeps lexicographic order chronological
std::string log_key(uint64_t timestamp_ms) {
    char prefix[24];
    std::snprintf(prefix, sizeof(prefix), "%020llu", static_cast<unsigned long long>(timestamp_ms));
    return std::string(prefix) + "-" + to_hex(crypto::Random::generate(4));
}

} // anonymous namespace

const char* key_type_to_string(KeyType type) {
    switch (type) {
        case KeyType::Team: return "team";
        case KeyType::User: return "user";
    }
    return "user";
}

std::optional<KeyType> key_type_from_string(const std::string& str) {
    if (str == "team") return KeyType::Team;
    if (str == "user") return KeyType::User;
    return std::nullopt;
}

// KeyMetadata

json KeyMetadata::to_json() const {
    json j = {
        {"keyId", key_id},
        {"keyType", key_type_to_string(type)},
        {"pubkey", to_hex(pubkey)},
        {"createdAt", time::to_string(time::from_timestamp(created_at))},
        {"expiresAt", time::to_string(time::from_timestamp(expires_at))},
        {"revoked", revoked},
        {"revocationReason", revocation_reason},
        {"metadata", metadata}
    };
    if (revoked_at) {
        j["revokedAt"] = time::to_string(time::from_timestamp(*revoked_at));
    }
    return j;
}

Result<KeyMetadata> KeyMetadata::from_json(const json& j) {
    using R = Result<KeyMetadata>;
    try {
        KeyMetadata m;
        m.key_id = j.at("keyId").get<std::string>();
        auto type = key_type_from_string(j.at("keyType").get<std::string>());
        if (!type) {
            return R::Err(ErrorCode::InvalidFormat, "Unknown key type");
        }
        m.type = *type;
        auto pubkey = fixed_from_hex<32>(j.at("pubkey").get<std::string>());
        if (!pubkey) {
            return R::Err(ErrorCode::InvalidFormat, "Invalid public key in key metadata");
        }
        m.pubkey = *pubkey;
        m.created_at = time::to_timestamp(time::from_string(j.at("createdAt").get<std::string>()));
        m.expires_at = time::to_timestamp(time::from_string(j.at("expiresAt").get<std::string>()));
        m.revoked = j.at("revoked").get<bool>();
        if (j.contains("revokedAt")) {
            m.revoked_at = time::to_timestamp(time::from_string(j.at("revokedAt").get<std::string>()));
        }
        m.revocation_reason = j.value("revocationReason", "");
        m.metadata = j.value("metadata", json::object());
        return R::Ok(std::move(m));
    } catch (const json::exception& e) {
        return R::Err(Error(ErrorCode::DeserializationFailed, "Malformed key metadata", e.what()));
    } catch (const std::runtime_error& e) {
        return R::Err(Error(ErrorCode::DeserializationFailed, "Malformed key metadata timestamp", e.what()));
    }
}

// VerificationLogEntry

json VerificationLogEntry::to_json() const {
    return {
        {"verificationType", verification_type},
        {"subjectId", subject_id},
        {"success", success},
        {"root", root},
        {"signer", signer},
        {"error", error},
        {"timestampMs", timestamp_ms}
    };
}

Result<VerificationLogEntry> VerificationLogEntry::from_json(const json& j) {
    try {
        VerificationLogEntry e;
        e.verification_type = j.at("verificationType").get<std::string>();
        e.subject_id = j.at("subjectId").get<std::string>();
        e.success = j.at("success").get<bool>();
        e.root = j.value("root", "");
        e.signer = j.value("signer", "");
        e.error = j.value("error", "");
        e.timestamp_ms = j.at("timestampMs").get<uint64_t>();
        return Result<VerificationLogEntry>::Ok(std::move(e));
    } catch (const json::exception& ex) {
        return Result<VerificationLogEntry>::Err(
            Error(ErrorCode::DeserializationFailed, "Malformed verification log entry", ex.what()));
    }
}

// ReceiptStore

ReceiptStore::ReceiptStore(std::shared_ptr<EncryptedStore> store)
    : store_(std::move(store))
{
    if (!store_) {
        throw StorageException(ErrorCode::InvalidArgument, "ReceiptStore requires an open store");
    }
}

Result<StoreOutcome> ReceiptStore::store_receipt(const artifacts::Receipt& receipt) {
    using R = Result<StoreOutcome>;
    if (!artifacts::Receipts::verify(receipt)) {
        return R::Err(ErrorCode::ReceiptInvalid, "Receipt failed verification: " + receipt.receipt_hash);
    }

    std::lock_guard<std::mutex> lock(write_mutex_);

    ZULU_TRY_UNWRAP(existing, get_receipt(receipt.receipt_hash));
    if (existing) {
        if (artifacts::Receipts::same_content(*existing, receipt)) {
            ZULU_LOG_DEBUG("Receipt {} already stored", receipt.receipt_hash);
            return R::Ok(StoreOutcome::AlreadyPresent);
        }
        ZULU_LOG_ERROR("Receipt hash collision for {}", receipt.receipt_hash);
        return R::Err(ErrorCode::ReceiptCollision,
                      "A different receipt is stored under hash " + receipt.receipt_hash);
    }

    ZULU_TRY(store_->put(RECEIPTS_TABLE, receipt.receipt_hash, encode(receipt.to_json())));
    ZULU_LOG_INFO("Stored {} receipt {} for {}", artifacts::receipt_kind_to_string(receipt.kind),
                  receipt.receipt_hash, receipt.subject_id);
    return R::Ok(StoreOutcome::Inserted);
}

Result<std::optional<artifacts::Receipt>> ReceiptStore::get_receipt(const std::string& receipt_hash) const {
    using R = Result<std::optional<artifacts::Receipt>>;
    if (!artifacts::Receipts::is_valid_receipt_hash(receipt_hash)) {
        return R::Err(ErrorCode::InvalidArgument, "Invalid receipt hash: " + receipt_hash);
    }

    ZULU_TRY_UNWRAP(record, store_->get(RECEIPTS_TABLE, receipt_hash));
    if (!record) {
        return R::Ok(std::nullopt);
    }
    ZULU_TRY_UNWRAP(j, decode(*record));
    ZULU_TRY_UNWRAP(receipt, artifacts::Receipt::from_json(j));
    return R::Ok(std::move(receipt));
}

Result<std::vector<artifacts::Receipt>> ReceiptStore::receipts_for_subject(const std::string& subject_id) const {
    using R = Result<std::vector<artifacts::Receipt>>;
    ZULU_TRY_UNWRAP(hashes, store_->list(RECEIPTS_TABLE));

    std::vector<artifacts::Receipt> receipts;
    for (const auto& hash : hashes) {
        ZULU_TRY_UNWRAP(receipt, get_receipt(hash));
        if (receipt && receipt->subject_id == subject_id) {
            receipts.push_back(std::move(*receipt));
        }
    }
    std::sort(receipts.begin(), receipts.end(), [](const auto& a, const auto& b) {
        return a.timestamp < b.timestamp;
    });
    return R::Ok(std::move(receipts));
}

Result<void> ReceiptStore::store_key_metadata(const KeyMetadata& metadata) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    ZULU_TRY(store_->put(KEY_METADATA_TABLE, to_hex(metadata.pubkey), encode(metadata.to_json())));
    ZULU_LOG_DEBUG("Stored {} key metadata for {}", key_type_to_string(metadata.type),
                   to_hex(metadata.pubkey).substr(0, 16));
    return Result<void>::Ok();
}

Result<std::optional<KeyMetadata>> ReceiptStore::get_key_metadata(const PublicKey& pubkey) const {
    using R = Result<std::optional<KeyMetadata>>;
    ZULU_TRY_UNWRAP(record, store_->get(KEY_METADATA_TABLE, to_hex(pubkey)));
    if (!record) {
        return R::Ok(std::nullopt);
    }
    ZULU_TRY_UNWRAP(j, decode(*record));
    ZULU_TRY_UNWRAP(metadata, KeyMetadata::from_json(j));
    return R::Ok(std::move(metadata));
}

Result<void> ReceiptStore::mark_key_revoked(const PublicKey& pubkey, uint64_t revoked_at,
                                            const std::string& reason) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    ZULU_TRY_UNWRAP(existing, get_key_metadata(pubkey));
    if (!existing) {
        return Result<void>::Err(ErrorCode::StorageNotFound, "No metadata for key " + to_hex(pubkey));
    }
    existing->revoked = true;
    existing->revoked_at = revoked_at;
    existing->revocation_reason = reason;

    ZULU_TRY(store_->put(KEY_METADATA_TABLE, to_hex(pubkey), encode(existing->to_json())));
    return Result<void>::Ok();
}

Result<std::vector<KeyMetadata>> ReceiptStore::query_expiring_keys(uint32_t within_days, uint64_t now) const {
    using R = Result<std::vector<KeyMetadata>>;
    ZULU_TRY_UNWRAP(all, all_key_metadata());

    uint64_t horizon = now + static_cast<uint64_t>(within_days) * constants::SECONDS_PER_DAY;
    std::vector<KeyMetadata> expiring;
    for (auto& m : all) {
        if (!m.revoked && m.expires_at >= now && m.expires_at <= horizon) {
            expiring.push_back(std::move(m));
        }
    }
    std::sort(expiring.begin(), expiring.end(), [](const auto& a, const auto& b) {
        return a.expires_at < b.expires_at;
    });
    return R::Ok(std::move(expiring));
}

Result<std::vector<KeyMetadata>> ReceiptStore::all_key_metadata() const {
    using R = Result<std::vector<KeyMetadata>>;
    ZULU_TRY_UNWRAP(ids, store_->list(KEY_METADATA_TABLE));

    std::vector<KeyMetadata> all;
    all.reserve(ids.size());
    for (const auto& id : ids) {
        ZULU_TRY_UNWRAP(record, store_->get(KEY_METADATA_TABLE, id));
        if (!record) continue;  // removed concurrently
        ZULU_TRY_UNWRAP(j, decode(*record));
        ZULU_TRY_UNWRAP(metadata, KeyMetadata::from_json(j));
        all.push_back(std::move(metadata));
    }
    return R::Ok(std::move(all));
}

Result<void> ReceiptStore::log_verification(const VerificationLogEntry& entry) {
    VerificationLogEntry stamped = entry;
    if (stamped.timestamp_ms == 0) {
        stamped.timestamp_ms = time::timestamp_milliseconds();
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    return store_->put(VERIFICATION_LOG_TABLE, log_key(stamped.timestamp_ms), encode(stamped.to_json()));
}

Result<std::vector<VerificationLogEntry>> ReceiptStore::verification_logs(
    const std::string& verification_type,
    const std::string& subject_id,
    size_t limit
) const {
    using R = Result<std::vector<VerificationLogEntry>>;
    ZULU_TRY_UNWRAP(keys, store_->list(VERIFICATION_LOG_TABLE));

    std::vector<VerificationLogEntry> entries;
    for (auto it = keys.rbegin(); it != keys.rend(); ++it) {
        ZULU_TRY_UNWRAP(record, store_->get(VERIFICATION_LOG_TABLE, *it));
        if (!record) continue;
        ZULU_TRY_UNWRAP(j, decode(*record));
        ZULU_TRY_UNWRAP(entry, VerificationLogEntry::from_json(j));

        if (!verification_type.empty() && entry.verification_type != verification_type) continue;
        if (!subject_id.empty() && entry.subject_id != subject_id) continue;

        entries.push_back(std::move(entry));
        if (limit != 0 && entries.size() >= limit) break;
    }
    return R::Ok(std::move(entries));
}

} // namespace zulu::storage
