#include "trust/trust_policy.hpp"
#include "storage/encrypted_store.hpp"
#include "storage/receipt_store.hpp"
#include "crypto/random.hpp"
#include "keys/key_pair.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <thread>

using namespace zulu;
using namespace zulu::trust;

namespace fs = std::filesystem;

namespace {

constexpr uint64_t DAY = constants::SECONDS_PER_DAY;
constexpr uint64_t T0 = 1700000000;

} // anonymous namespace

class TrustPolicyTest : public ::testing::Test {
protected:
    uint64_t now = T0;
    PublicKey team_key = keys::KeyPair::generate().public_key();    // "A"
    PublicKey user_key = keys::KeyPair::generate().public_key();    // "B"
    PublicKey stranger = keys::KeyPair::generate().public_key();

    std::unique_ptr<TrustPolicyEngine> make_engine(TrustPolicy policy) {
        TrustConfig config;
        config.policy = policy;
        auto engine = std::make_unique<TrustPolicyEngine>(config, nullptr, [this] { return now; });
        EXPECT_TRUE(engine->add_team_key(team_key).is_ok());
        return engine;
    }
};

TEST_F(TrustPolicyTest, StrictTrustsTeamKeysOnly) {
    auto engine = make_engine(TrustPolicy::Strict);
    ASSERT_TRUE(engine->approve_key(user_key).is_ok());

    auto team = engine->verify_key_trust(team_key);
    EXPECT_TRUE(team.trusted);
    EXPECT_FALSE(team.warning);
    EXPECT_EQ(team.status, KeyStatus::Team);

    auto user = engine->verify_key_trust(user_key);
    EXPECT_FALSE(user.trusted);
    EXPECT_EQ(user.status, KeyStatus::Approved);
    EXPECT_EQ(user.error_code, std::optional<ErrorCode>(ErrorCode::UntrustedSigner));

    auto enforced = engine->enforce(user_key);
    ASSERT_TRUE(enforced.is_err());
    EXPECT_EQ(enforced.error().code(), ErrorCode::UntrustedSigner);
}

TEST_F(TrustPolicyTest, WarnTrustsApprovedKeysWithWarning) {
    auto engine = make_engine(TrustPolicy::Warn);

    EXPECT_FALSE(engine->verify_key_trust(user_key).trusted);
    ASSERT_TRUE(engine->approve_key(user_key).is_ok());

    auto user = engine->verify_key_trust(user_key);
    EXPECT_TRUE(user.trusted);
    EXPECT_TRUE(user.warning);
    EXPECT_FALSE(user.warning_message.empty());

    auto team = engine->verify_key_trust(team_key);
    EXPECT_TRUE(team.trusted);
    EXPECT_FALSE(team.warning);
}

TEST_F(TrustPolicyTest, BestEffortAlwaysWarns) {
    auto engine = make_engine(TrustPolicy::BestEffort);

    auto unknown = engine->verify_key_trust(stranger);
    EXPECT_TRUE(unknown.trusted);
    EXPECT_TRUE(unknown.warning);
    EXPECT_EQ(unknown.status, KeyStatus::Unknown);

    auto team = engine->verify_key_trust(team_key);
    EXPECT_TRUE(team.trusted);
    EXPECT_TRUE(team.warning);
}

TEST_F(TrustPolicyTest, RevokedTeamKeyRejectedUnderEveryPolicy) {
    for (auto policy : {TrustPolicy::Strict, TrustPolicy::Warn, TrustPolicy::BestEffort}) {
        auto engine = make_engine(policy);
        ASSERT_TRUE(engine->revoke_key(team_key, "compromised").is_ok());

        auto decision = engine->verify_key_trust(team_key);
        EXPECT_FALSE(decision.trusted) << trust_policy_to_string(policy);
        EXPECT_EQ(decision.status, KeyStatus::Revoked);
        EXPECT_NE(decision.reason.find("compromised"), std::string::npos);

        auto enforced = engine->enforce(team_key);
        ASSERT_TRUE(enforced.is_err());
        EXPECT_EQ(enforced.error().code(), ErrorCode::KeyRevoked);
    }
}

TEST_F(TrustPolicyTest, RevocationIsTerminal) {
    auto engine = make_engine(TrustPolicy::Warn);
    ASSERT_TRUE(engine->approve_key(user_key).is_ok());
    ASSERT_TRUE(engine->revoke_key(user_key, "rotated").is_ok());

    auto reapprove = engine->approve_key(user_key);
    ASSERT_TRUE(reapprove.is_err());
    EXPECT_EQ(reapprove.error().code(), ErrorCode::KeyRevoked);
    EXPECT_EQ(engine->status_of(user_key), KeyStatus::Revoked);

    // Re-adding to the team keyring does not lift a revocation
    ASSERT_TRUE(engine->add_team_key(user_key).is_ok());
    EXPECT_FALSE(engine->verify_key_trust(user_key).trusted);
}

TEST_F(TrustPolicyTest, ApproveIsIdempotent) {
    auto engine = make_engine(TrustPolicy::Warn);
    ASSERT_TRUE(engine->approve_key(user_key).is_ok());
    now += 10 * DAY;
    ASSERT_TRUE(engine->approve_key(user_key).is_ok());

    EXPECT_EQ(engine->state().approved_keys.size(), 1u);
    // Issuance time is kept from the first approval; the team key is outside the window
    auto expiring = engine->expiring_keys(365);
    ASSERT_EQ(expiring.size(), 1u);
    EXPECT_EQ(expiring[0].pubkey, user_key);
    EXPECT_EQ(expiring[0].status, KeyStatus::Approved);
    EXPECT_EQ(expiring[0].expires_at, T0 + constants::USER_KEY_LIFETIME_DAYS * DAY);
}

TEST_F(TrustPolicyTest, ExpirationEvaluatedAtCheckTime) {
    auto engine = make_engine(TrustPolicy::Warn);
    ASSERT_TRUE(engine->approve_key(user_key).is_ok());

    EXPECT_TRUE(engine->verify_key_trust(user_key).trusted);

    now = T0 + constants::USER_KEY_LIFETIME_DAYS * DAY;
    auto expired = engine->verify_key_trust(user_key);
    EXPECT_FALSE(expired.trusted);
    EXPECT_EQ(expired.status, KeyStatus::Expired);
    EXPECT_EQ(expired.error_code, std::optional<ErrorCode>(ErrorCode::KeyExpired));

    // Team keys live longer
    EXPECT_TRUE(engine->verify_key_trust(team_key).trusted);
    now = T0 + constants::TEAM_KEY_LIFETIME_DAYS * DAY;
    EXPECT_EQ(engine->enforce(team_key).error().code(), ErrorCode::KeyExpired);
}

TEST_F(TrustPolicyTest, ExpiryWarningWindow) {
    auto engine = make_engine(TrustPolicy::Strict);

    now = T0 + (constants::TEAM_KEY_LIFETIME_DAYS - 10) * DAY;
    auto decision = engine->verify_key_trust(team_key);
    EXPECT_TRUE(decision.trusted);
    EXPECT_TRUE(decision.warning);
    EXPECT_NE(decision.warning_message.find("Key expires in 10 days"), std::string::npos);

    auto expiring = engine->expiring_keys(30);
    ASSERT_EQ(expiring.size(), 1u);
    EXPECT_EQ(expiring[0].days_remaining, 10u);
}

TEST_F(TrustPolicyTest, PolicyStrings) {
    EXPECT_STREQ(trust_policy_to_string(TrustPolicy::BestEffort), "BEST_EFFORT");
    EXPECT_EQ(trust_policy_from_string("STRICT"), std::optional<TrustPolicy>(TrustPolicy::Strict));
    EXPECT_FALSE(trust_policy_from_string("strict").has_value());

    auto engine = make_engine(TrustPolicy::Strict);
    engine->set_policy(TrustPolicy::BestEffort);
    EXPECT_EQ(engine->policy(), TrustPolicy::BestEffort);
    EXPECT_TRUE(engine->verify_key_trust(stranger).trusted);
}

TEST_F(TrustPolicyTest, ConcurrentChecksNeverSeeHalfRevocation) {
    auto engine = make_engine(TrustPolicy::Strict);
    std::atomic<bool> revoked{false};
    std::atomic<int> violations{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            for (int i = 0; i < 2000; ++i) {
                bool seen_revoked = revoked.load();
                auto decision = engine->verify_key_trust(team_key);
                // Once revocation is published, no later check may trust the key
                if (seen_revoked && decision.trusted) {
                    violations++;
                }
            }
        });
    }

    ASSERT_TRUE(engine->revoke_key(team_key, "incident").is_ok());
    revoked = true;

    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_EQ(violations.load(), 0);
}

class TrustPersistenceTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::shared_ptr<storage::EncryptedStore> store;
    std::unique_ptr<storage::ReceiptStore> receipts;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("zulu_trust_test_" + to_hex(crypto::Random::generate(4)));
        auto opened = storage::EncryptedStore::open_with_key(test_dir, SessionKey{});
        ASSERT_TRUE(opened.is_ok());
        store = std::make_shared<storage::EncryptedStore>(std::move(opened.value()));
        receipts = std::make_unique<storage::ReceiptStore>(store);
    }

    void TearDown() override {
        receipts.reset();
        store.reset();
        fs::remove_all(test_dir);
    }
};

TEST_F(TrustPersistenceTest, LifecycleSurvivesRestart) {
    auto team = keys::KeyPair::generate().public_key();
    auto approved = keys::KeyPair::generate().public_key();
    auto revoked = keys::KeyPair::generate().public_key();
    uint64_t now = T0;

    {
        TrustPolicyEngine engine(TrustConfig{}, receipts.get(), [&] { return now; });
        ASSERT_TRUE(engine.add_team_key(team).is_ok());
        ASSERT_TRUE(engine.approve_key(approved).is_ok());
        ASSERT_TRUE(engine.approve_key(revoked).is_ok());
        ASSERT_TRUE(engine.revoke_key(revoked, "leaked").is_ok());
    }

    auto metadata = receipts->get_key_metadata(revoked);
    ASSERT_TRUE(metadata.is_ok());
    ASSERT_TRUE(metadata.value().has_value());
    EXPECT_TRUE(metadata.value()->revoked);
    EXPECT_EQ(metadata.value()->revocation_reason, "leaked");

    TrustPolicyEngine restored(TrustConfig{}, receipts.get(), [&] { return now; });
    ASSERT_TRUE(restored.restore_from_store().is_ok());
    EXPECT_EQ(restored.status_of(team), KeyStatus::Team);
    EXPECT_EQ(restored.status_of(approved), KeyStatus::Approved);
    EXPECT_EQ(restored.status_of(revoked), KeyStatus::Revoked);
}

TEST_F(TrustPersistenceTest, ApprovingTeamKeyKeepsTeamRecord) {
    auto team = keys::KeyPair::generate().public_key();
    uint64_t now = T0;
    TrustConfig config;
    config.policy = TrustPolicy::Strict;

    {
        TrustPolicyEngine engine(config, receipts.get(), [&] { return now; });
        ASSERT_TRUE(engine.add_team_key(team).is_ok());
        now += 30 * constants::SECONDS_PER_DAY;
        ASSERT_TRUE(engine.approve_key(team).is_ok());
        EXPECT_EQ(engine.status_of(team), KeyStatus::Team);
    }

    auto metadata = receipts->get_key_metadata(team);
    ASSERT_TRUE(metadata.is_ok());
    ASSERT_TRUE(metadata.value().has_value());
    EXPECT_EQ(metadata.value()->type, storage::KeyType::Team);
    EXPECT_EQ(metadata.value()->created_at, T0);
    EXPECT_EQ(metadata.value()->expires_at,
              T0 + static_cast<uint64_t>(constants::TEAM_KEY_LIFETIME_DAYS) * constants::SECONDS_PER_DAY);

    TrustPolicyEngine restored(config, receipts.get(), [&] { return now; });
    ASSERT_TRUE(restored.restore_from_store().is_ok());
    EXPECT_EQ(restored.status_of(team), KeyStatus::Team);
    auto decision = restored.verify_key_trust(team);
    EXPECT_TRUE(decision.trusted);
    EXPECT_FALSE(decision.error_code.has_value());
}

TEST_F(TrustPersistenceTest, RevokingUnknownKeyIsRecorded) {
    auto key = keys::KeyPair::generate().public_key();
    TrustPolicyEngine engine(TrustConfig{}, receipts.get(), [] { return T0; });
    ASSERT_TRUE(engine.revoke_key(key, "never trusted").is_ok());

    auto metadata = receipts->get_key_metadata(key);
    ASSERT_TRUE(metadata.is_ok());
    ASSERT_TRUE(metadata.value().has_value());
    EXPECT_TRUE(metadata.value()->revoked);
}
