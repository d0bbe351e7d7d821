#include "encrypted_store.hpp"
#include "crypto/chacha20poly1305.hpp"
#include "utils/file_io.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <sodium.h>
#include <algorithm>
#include <fstream>
#include <mutex>
#include <shared_mutex>

namespace zulu::storage {

using json = nlohmann::json;

namespace {

const char* VERIFIER_PLAINTEXT = "zulu-encrypted-store-v1";
const char* VERIFIER_AAD = "store/verifier";
const char* RECORD_SUFFIX = ".rec";

bool valid_table_name(const std::string& table) {
    if (table.empty() || table.size() > 64) return false;
    return std::all_of(table.begin(), table.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    });
}

bytes to_bytes(const std::string& s) {
    return bytes(s.begin(), s.end());
}

bytes seal(const bytes& plaintext, const SessionKey& key, const bytes& aad) {
    Nonce nonce = crypto::ChaCha20Poly1305::generate_nonce();
    bytes ciphertext = crypto::ChaCha20Poly1305::encrypt(plaintext, key, nonce, aad);

    bytes record;
    record.reserve(nonce.size() + ciphertext.size());
    record.insert(record.end(), nonce.begin(), nonce.end());
    record.insert(record.end(), ciphertext.begin(), ciphertext.end());
    return record;
}

std::optional<bytes> unseal(const bytes& record, const SessionKey& key, const bytes& aad) {
    if (record.size() < constants::CHACHA20_NONCE_SIZE + constants::POLY1305_TAG_SIZE) {
        return std::nullopt;
    }
    Nonce nonce;
    std::copy(record.begin(), record.begin() + nonce.size(), nonce.begin());
    bytes ciphertext(record.begin() + nonce.size(), record.end());
    return crypto::ChaCha20Poly1305::decrypt(ciphertext, key, nonce, aad);
}

} // anonymous namespace

class EncryptedStore::Impl {
public:
    Impl(const std::filesystem::path& data_dir, const SessionKey& master_key)
        : data_dir_(data_dir)
        , master_key_(master_key)
    {}

    ~Impl() {
        sodium_memzero(master_key_.data(), master_key_.size());
    }

    Result<void> check_verifier() {
        auto verifier_path = data_dir_ / "store.verifier";
        if (!std::filesystem::exists(verifier_path)) {
            bytes sealed = seal(to_bytes(VERIFIER_PLAINTEXT), master_key_, to_bytes(VERIFIER_AAD));
            ZULU_TRY(utils::atomic_write_file(verifier_path, sealed));
            ZULU_LOG_INFO("Encrypted store initialized at: {}", data_dir_.string());
            return Result<void>::Ok();
        }

        ZULU_TRY_UNWRAP(sealed, utils::read_file(verifier_path));
        auto plaintext = unseal(sealed, master_key_, to_bytes(VERIFIER_AAD));
        if (!plaintext || *plaintext != to_bytes(VERIFIER_PLAINTEXT)) {
            return Result<void>::Err(ErrorCode::StorageAuthenticationFailed,
                                     "Store key rejected (wrong passphrase?): " + data_dir_.string());
        }
        ZULU_LOG_INFO("Encrypted store opened at: {}", data_dir_.string());
        return Result<void>::Ok();
    }

    Result<std::filesystem::path> record_path(const std::string& table, const std::string& key) const {
        if (!valid_table_name(table)) {
            return Result<std::filesystem::path>::Err(ErrorCode::InvalidArgument, "Invalid table name: " + table);
        }
        if (key.empty() || key.size() > MAX_KEY_LENGTH) {
            return Result<std::filesystem::path>::Err(ErrorCode::InvalidArgument,
                                                      "Record key must be 1-120 bytes");
        }
        // Hex-encode the key so any byte string maps to a safe, reversible file name
        std::string file_name = to_hex(reinterpret_cast<const byte*>(key.data()), key.size()) + RECORD_SUFFIX;
        return Result<std::filesystem::path>::Ok(data_dir_ / table / file_name);
    }

    static bytes aad_for(const std::string& table, const std::string& key) {
        return to_bytes(table + "/" + key);
    }

    Result<void> put(const std::string& table, const std::string& key, const bytes& value) {
        ZULU_TRY_UNWRAP(path, record_path(table, key));
        std::unique_lock lock(mutex_);

        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void>::Err(ErrorCode::StorageWriteFailed,
                                     "Failed to create table directory: " + ec.message());
        }

        bytes record = seal(value, master_key_, aad_for(table, key));
        ZULU_TRY(utils::atomic_write_file(path, record));

        ZULU_LOG_DEBUG("Stored record {}/{} ({} bytes)", table, key, value.size());
        return Result<void>::Ok();
    }

    Result<std::optional<bytes>> get(const std::string& table, const std::string& key) const {
        using R = Result<std::optional<bytes>>;
        ZULU_TRY_UNWRAP(path, record_path(table, key));
        std::shared_lock lock(mutex_);

        if (!std::filesystem::exists(path)) {
            return R::Ok(std::nullopt);
        }

        ZULU_TRY_UNWRAP(record, utils::read_file(path));
        auto plaintext = unseal(record, master_key_, aad_for(table, key));
        if (!plaintext) {
            ZULU_LOG_ERROR("Record {}/{} failed authentication", table, key);
            return R::Err(ErrorCode::StorageCorrupted, "Record failed authentication: " + table + "/" + key);
        }
        return R::Ok(std::move(*plaintext));
    }

    Result<bool> remove(const std::string& table, const std::string& key) {
        ZULU_TRY_UNWRAP(path, record_path(table, key));
        std::unique_lock lock(mutex_);

        std::error_code ec;
        bool removed = std::filesystem::remove(path, ec);
        if (ec) {
            return Result<bool>::Err(ErrorCode::StorageWriteFailed,
                                     "Failed to delete record: " + ec.message());
        }
        return Result<bool>::Ok(removed);
    }

    Result<std::vector<std::string>> list(const std::string& table) const {
        using R = Result<std::vector<std::string>>;
        if (!valid_table_name(table)) {
            return R::Err(ErrorCode::InvalidArgument, "Invalid table name: " + table);
        }
        std::shared_lock lock(mutex_);

        std::vector<std::string> keys;
        auto dir = data_dir_ / table;
        if (!std::filesystem::exists(dir)) {
            return R::Ok(std::move(keys));
        }

        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            if (!entry.is_regular_file()) continue;
            std::string name = entry.path().filename().string();
            std::string suffix(RECORD_SUFFIX);
            if (name.size() <= suffix.size() ||
                name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
                continue;  // temp files and strays
            }
            auto decoded = from_hex(name.substr(0, name.size() - suffix.size()));
            if (!decoded) {
                ZULU_LOG_WARN("Ignoring unexpected file in table {}: {}", table, name);
                continue;
            }
            keys.emplace_back(decoded->begin(), decoded->end());
        }
        if (ec) {
            return R::Err(ErrorCode::StorageReadFailed, "Failed to list table " + table + ": " + ec.message());
        }

        std::sort(keys.begin(), keys.end());
        return R::Ok(std::move(keys));
    }

    bool contains(const std::string& table, const std::string& key) const {
        auto path = record_path(table, key);
        if (path.is_err()) {
            return false;
        }
        std::shared_lock lock(mutex_);
        return std::filesystem::exists(path.value());
    }

    const std::filesystem::path& data_dir() const { return data_dir_; }

private:
    std::filesystem::path data_dir_;
    SessionKey master_key_;
    mutable std::shared_mutex mutex_;
};

// EncryptedStore

EncryptedStore::EncryptedStore(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
EncryptedStore::~EncryptedStore() = default;
EncryptedStore::EncryptedStore(EncryptedStore&&) noexcept = default;
EncryptedStore& EncryptedStore::operator=(EncryptedStore&&) noexcept = default;

Result<EncryptedStore> EncryptedStore::open_with_key(
    const std::filesystem::path& data_dir,
    const SessionKey& master_key
) {
    std::error_code ec;
    std::filesystem::create_directories(data_dir, ec);
    if (ec) {
        return Result<EncryptedStore>::Err(ErrorCode::StorageWriteFailed,
                                           "Failed to create data directory: " + ec.message());
    }

    auto impl = std::make_unique<Impl>(data_dir, master_key);
    ZULU_TRY(impl->check_verifier());
    return Result<EncryptedStore>::Ok(EncryptedStore(std::move(impl)));
}

Result<EncryptedStore> EncryptedStore::open_with_passphrase(
    const std::filesystem::path& data_dir,
    const std::string& passphrase,
    const crypto::Argon2::Params& params
) {
    using R = Result<EncryptedStore>;
    if (passphrase.empty()) {
        return R::Err(ErrorCode::InvalidArgument, "Store passphrase must not be empty");
    }

    std::error_code ec;
    std::filesystem::create_directories(data_dir, ec);
    if (ec) {
        return R::Err(ErrorCode::StorageWriteFailed, "Failed to create data directory: " + ec.message());
    }

    auto header_path = data_dir / "store.json";
    bytes salt;
    crypto::Argon2::Params effective = params;

    if (std::filesystem::exists(header_path)) {
        try {
            std::ifstream file(header_path);
            json header = json::parse(file);
            auto decoded = from_hex(header.at("salt").get<std::string>());
            if (!decoded || decoded->size() != crypto::Argon2::SALT_SIZE) {
                return R::Err(ErrorCode::StorageCorrupted, "Invalid salt in store header");
            }
            salt = *decoded;
            const auto& kdf = header.at("kdf");
            effective.memory_cost_kb = kdf.at("memoryKb").get<uint32_t>();
            effective.time_cost = kdf.at("timeCost").get<uint32_t>();
            effective.parallelism = kdf.at("parallelism").get<uint32_t>();
        } catch (const json::exception& e) {
            return R::Err(Error(ErrorCode::StorageCorrupted, "Malformed store header", e.what()));
        }
    } else {
        salt = crypto::Argon2::generate_salt();
        json header = {
            {"version", 1},
            {"salt", to_hex(salt)},
            {"kdf", {
                {"algorithm", "argon2id"},
                {"memoryKb", params.memory_cost_kb},
                {"timeCost", params.time_cost},
                {"parallelism", params.parallelism}
            }}
        };
        ZULU_TRY(utils::atomic_write_file(header_path, header.dump(2)));
    }

    bytes password(passphrase.begin(), passphrase.end());
    bytes derived = crypto::Argon2::hash(password, salt, effective, constants::CHACHA20_KEY_SIZE);
    sodium_memzero(password.data(), password.size());

    SessionKey master_key;
    std::copy(derived.begin(), derived.end(), master_key.begin());
    sodium_memzero(derived.data(), derived.size());

    auto store = open_with_key(data_dir, master_key);
    sodium_memzero(master_key.data(), master_key.size());
    return store;
}

Result<void> EncryptedStore::put(const std::string& table, const std::string& key, const bytes& value) {
    return impl_->put(table, key, value);
}

Result<std::optional<bytes>> EncryptedStore::get(const std::string& table, const std::string& key) const {
    return impl_->get(table, key);
}

Result<bool> EncryptedStore::remove(const std::string& table, const std::string& key) {
    return impl_->remove(table, key);
}

Result<std::vector<std::string>> EncryptedStore::list(const std::string& table) const {
    return impl_->list(table);
}

bool EncryptedStore::contains(const std::string& table, const std::string& key) const {
    return impl_->contains(table, key);
}

const std::filesystem::path& EncryptedStore::data_dir() const {
    return impl_->data_dir();
}

} // namespace zulu::storage
