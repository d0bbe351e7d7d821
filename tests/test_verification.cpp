#include "core/verification.hpp"
#include "chunking/commitment.hpp"
#include "crypto/random.hpp"
#include "utils/config.hpp"
#include "utils/file_io.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>

using namespace zulu;
using namespace zulu::core;

namespace fs = std::filesystem;

TEST(SystemConfigTest, ParsesAllKeys) {
    auto team = keys::KeyPair::generate().public_key();
    auto config = utils::Config::load_from_json(R"({
        "data_dir": "/var/lib/zulu",
        "temp_dir": "/var/tmp/zulu",
        "passphrase": "correct horse",
        "trust_policy": "STRICT",
        "expiry_warning_days": 14,
        "team_keys": [")" + to_hex(team) + R"("],
        "prefer_native_secret_store": false,
        "resumable": false,
        "log_level": "debug",
        "kdf": "minimal"
    })");

    auto parsed = SystemConfig::from_config(config);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().to_string();
    const auto& sc = parsed.value();
    EXPECT_EQ(sc.data_dir, fs::path("/var/lib/zulu"));
    EXPECT_EQ(sc.temp_dir, fs::path("/var/tmp/zulu"));
    EXPECT_EQ(sc.passphrase, "correct horse");
    EXPECT_EQ(sc.trust.policy, trust::TrustPolicy::Strict);
    EXPECT_EQ(sc.trust.expiry_warning_days, 14u);
    EXPECT_EQ(sc.trust.team_key_lifetime_days, constants::TEAM_KEY_LIFETIME_DAYS);
    ASSERT_EQ(sc.team_keys.size(), 1u);
    EXPECT_EQ(sc.team_keys[0], team);
    EXPECT_FALSE(sc.prefer_native_secret_store);
    EXPECT_FALSE(sc.resumable);
    EXPECT_EQ(sc.log_level, "debug");
    EXPECT_EQ(sc.kdf.memory_cost_kb, crypto::Argon2::Params::minimal().memory_cost_kb);
    EXPECT_EQ(sc.kdf.time_cost, 1u);
}

TEST(SystemConfigTest, PassphraseFromEnvironment) {
    ::setenv("ZULU_TEST_PASSPHRASE", "from the environment", 1);
    auto parsed = SystemConfig::from_config(
        utils::Config::load_from_json(R"({"passphrase_env": "ZULU_TEST_PASSPHRASE"})"));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().passphrase, "from the environment");
    EXPECT_EQ(parsed.value().trust.policy, trust::TrustPolicy::Warn);
    ::unsetenv("ZULU_TEST_PASSPHRASE");

    auto unset = SystemConfig::from_config(
        utils::Config::load_from_json(R"({"passphrase_env": "ZULU_TEST_PASSPHRASE"})"));
    ASSERT_TRUE(unset.is_err());
    EXPECT_EQ(unset.error().code(), ErrorCode::InvalidArgument);
}

TEST(SystemConfigTest, RejectsBadValues) {
    auto no_passphrase = SystemConfig::from_config(utils::Config::load_from_json("{}"));
    EXPECT_EQ(no_passphrase.error().code(), ErrorCode::InvalidArgument);

    auto bad_policy = SystemConfig::from_config(
        utils::Config::load_from_json(R"({"passphrase": "x", "trust_policy": "PARANOID"})"));
    EXPECT_EQ(bad_policy.error().code(), ErrorCode::InvalidArgument);

    auto bad_key = SystemConfig::from_config(
        utils::Config::load_from_json(R"({"passphrase": "x", "team_keys": ["abcd"]})"));
    EXPECT_EQ(bad_key.error().code(), ErrorCode::InvalidPublicKey);

    auto negative_days = SystemConfig::from_config(
        utils::Config::load_from_json(R"({"passphrase": "x", "expiry_warning_days": -1})"));
    ASSERT_TRUE(negative_days.is_err());
    EXPECT_EQ(negative_days.error().code(), ErrorCode::InvalidArgument);

    auto text_days = SystemConfig::from_config(
        utils::Config::load_from_json(R"({"passphrase": "x", "user_key_lifetime_days": "ninety"})"));
    EXPECT_TRUE(text_days.is_err());
}

class VerificationSystemTest : public ::testing::Test {
protected:
    fs::path test_dir;
    keys::KeyPair team = keys::KeyPair::generate();
    keys::KeyPair outsider = keys::KeyPair::generate();
    keys::KeyPair device = keys::KeyPair::generate();
    std::unique_ptr<VerificationSystem> system;
    bytes artifact;
    fs::path source;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("zulu_verify_test_" + to_hex(crypto::Random::generate(4)));
        fs::create_directories(test_dir);
        system = open_system();
        ASSERT_NE(system, nullptr);

        artifact = crypto::Random::generate(3 * 1024 * 1024 + 123);
        source = test_dir / "source.bin";
        ASSERT_TRUE(utils::atomic_write_file(source, artifact).is_ok());
    }

    void TearDown() override {
        system.reset();
        fs::remove_all(test_dir);
    }

    SystemConfig config() const {
        SystemConfig sc;
        sc.data_dir = test_dir / "data";
        sc.temp_dir = test_dir / "temp";
        sc.passphrase = "correct horse battery staple";
        sc.team_keys = {team.public_key()};
        sc.prefer_native_secret_store = false;
        sc.log_level = "warn";
        sc.kdf = crypto::Argon2::Params::minimal();
        return sc;
    }

    std::unique_ptr<VerificationSystem> open_system() {
        auto created = VerificationSystem::create(config());
        EXPECT_TRUE(created.is_ok()) << created.error().to_string();
        if (created.is_err()) {
            return nullptr;
        }
        return std::move(created.value());
    }

    artifacts::Manifest manifest_for(const bytes& data, chunking::ArtifactType type,
                                     const keys::KeyPair& signer, const std::string& id = "whisper-tiny") {
        auto commitment = chunking::Commitment::create_for_buffer(data, type);
        EXPECT_TRUE(commitment.is_ok());
        auto manifest = artifacts::Manifest::create(id, "1.0.0", "Zulu Team", commitment.value(),
                                                    std::nullopt, signer);
        EXPECT_TRUE(manifest.is_ok());
        return manifest.value();
    }
};

TEST_F(VerificationSystemTest, VerifiesTeamSignedArtifact) {
    auto manifest = manifest_for(artifact, chunking::ArtifactType::Model, team);
    auto output = test_dir / "models" / "whisper-tiny.bin";

    auto outcome = system->verify_artifact_file(manifest, source, output, &device);
    ASSERT_TRUE(outcome.success) << outcome.error->to_string();
    EXPECT_EQ(outcome.root, manifest.root);
    ASSERT_TRUE(outcome.trust.has_value());
    EXPECT_EQ(outcome.trust->status, trust::KeyStatus::Team);
    ASSERT_TRUE(outcome.download.has_value());
    EXPECT_EQ(outcome.download->verified_chunks, 4u);

    auto written = utils::read_file(output);
    ASSERT_TRUE(written.is_ok());
    EXPECT_EQ(written.value(), artifact);

    ASSERT_TRUE(outcome.receipt.has_value());
    auto stored = system->get_receipt(outcome.receipt->receipt_hash);
    ASSERT_TRUE(stored.is_ok());
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->root, manifest.root);
    EXPECT_EQ(stored.value()->signer_pubkey, device.public_key());
    EXPECT_EQ(stored.value()->metadata["chunkCount"], 4);

    auto logs = system->receipt_store().verification_logs("artifact", "whisper-tiny");
    ASSERT_TRUE(logs.is_ok());
    ASSERT_EQ(logs.value().size(), 1u);
    EXPECT_TRUE(logs.value()[0].success);
    EXPECT_EQ(logs.value()[0].root, hash_to_hex(manifest.root));
}

TEST_F(VerificationSystemTest, UntrustedSignerRejectedBeforeDownload) {
    auto manifest = manifest_for(artifact, chunking::ArtifactType::Model, outsider);
    auto output = test_dir / "out.bin";

    auto outcome = system->verify_artifact_file(manifest, source, output);
    ASSERT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error->code(), ErrorCode::UntrustedSigner);
    EXPECT_FALSE(outcome.download.has_value());
    EXPECT_FALSE(fs::exists(output));

    auto logs = system->receipt_store().verification_logs("artifact");
    ASSERT_TRUE(logs.is_ok());
    ASSERT_EQ(logs.value().size(), 1u);
    EXPECT_FALSE(logs.value()[0].success);
    EXPECT_EQ(logs.value()[0].signer, to_hex(outsider.public_key()));

    // Approved keys pass under WARN, with a warning
    ASSERT_TRUE(system->approve_key(outsider.public_key()).is_ok());
    auto approved = system->verify_artifact_file(manifest, source, output);
    ASSERT_TRUE(approved.success) << approved.error->to_string();
    EXPECT_TRUE(approved.trust->warning);
    EXPECT_FALSE(approved.receipt.has_value());

    // STRICT accepts team keys only
    system->set_trust_policy(trust::TrustPolicy::Strict);
    auto strict = system->verify_manifest(manifest);
    ASSERT_TRUE(strict.is_err());
    EXPECT_EQ(strict.error().code(), ErrorCode::UntrustedSigner);
}

TEST_F(VerificationSystemTest, TamperedManifestRejected) {
    auto manifest = manifest_for(artifact, chunking::ArtifactType::Model, team);
    manifest.chunk_digests[1][0] ^= 0x01;

    auto outcome = system->verify_artifact_file(manifest, source, test_dir / "out.bin");
    ASSERT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error->code(), ErrorCode::ManifestSignatureError);
    EXPECT_FALSE(fs::exists(test_dir / "out.bin"));
}

TEST_F(VerificationSystemTest, CorruptSourceFailsChunkCheck) {
    auto manifest = manifest_for(artifact, chunking::ArtifactType::Model, team);
    bytes corrupted = artifact;
    corrupted[2 * 1024 * 1024 + 5] ^= 0x01;
    ASSERT_TRUE(utils::atomic_write_file(source, corrupted).is_ok());

    auto outcome = system->verify_artifact_file(manifest, source, test_dir / "out.bin", &device);
    ASSERT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error->code(), ErrorCode::ChunkHashMismatch);
    ASSERT_TRUE(outcome.download.has_value());
    EXPECT_EQ(outcome.download->verified_chunks, 2u);
    EXPECT_FALSE(outcome.receipt.has_value());
    EXPECT_FALSE(fs::exists(test_dir / "out.bin"));
}

TEST_F(VerificationSystemTest, RevokedTeamKeyRejected) {
    auto manifest = manifest_for(artifact, chunking::ArtifactType::Model, team);
    ASSERT_TRUE(system->revoke_key(team.public_key(), "key compromise").is_ok());

    auto outcome = system->verify_artifact_file(manifest, source, test_dir / "out.bin");
    ASSERT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error->code(), ErrorCode::KeyRevoked);
}

TEST_F(VerificationSystemTest, TrustStateSurvivesRestart) {
    ASSERT_TRUE(system->approve_key(outsider.public_key()).is_ok());
    auto revoked = keys::KeyPair::generate().public_key();
    ASSERT_TRUE(system->revoke_key(revoked, "lost laptop").is_ok());
    system.reset();

    system = open_system();
    ASSERT_NE(system, nullptr);
    EXPECT_EQ(system->trust_engine().status_of(team.public_key()), trust::KeyStatus::Team);
    EXPECT_EQ(system->trust_engine().status_of(outsider.public_key()), trust::KeyStatus::Approved);
    EXPECT_EQ(system->trust_engine().status_of(revoked), trust::KeyStatus::Revoked);

    auto expiring = system->expiring_keys(constants::TEAM_KEY_LIFETIME_DAYS + 1);
    EXPECT_EQ(expiring.size(), 2u);
}

TEST_F(VerificationSystemTest, WrongPassphraseRefused) {
    system.reset();
    auto sc = config();
    sc.passphrase = "not the passphrase";
    auto created = VerificationSystem::create(sc);
    ASSERT_TRUE(created.is_err());
    EXPECT_EQ(created.error().code(), ErrorCode::StorageAuthenticationFailed);
}

TEST_F(VerificationSystemTest, PluginPackageGate) {
    bytes plugin = crypto::Random::generate(300000);
    auto manifest = manifest_for(plugin, chunking::ArtifactType::Plugin, team, "spellcheck");

    auto accepted = system->verify_plugin_package(manifest);
    EXPECT_TRUE(accepted.success);
    EXPECT_EQ(accepted.root, manifest.root);

    auto foreign = manifest_for(plugin, chunking::ArtifactType::Plugin, outsider, "spellcheck");
    auto rejected = system->verify_plugin_package(foreign);
    EXPECT_FALSE(rejected.success);
    EXPECT_EQ(rejected.error->code(), ErrorCode::UntrustedSigner);

    auto model = manifest_for(artifact, chunking::ArtifactType::Model, team);
    auto wrong_type = system->verify_plugin_package(model);
    EXPECT_FALSE(wrong_type.success);
    EXPECT_EQ(wrong_type.error->code(), ErrorCode::ManifestInvalid);

    auto logs = system->receipt_store().verification_logs("plugin");
    ASSERT_TRUE(logs.is_ok());
    EXPECT_EQ(logs.value().size(), 3u);
}

TEST_F(VerificationSystemTest, SessionBundleCommit) {
    bytes bundle = crypto::Random::generate(200000);

    auto first = system->commit_session_bundle("session-42", bundle, device);
    ASSERT_TRUE(first.success) << first.error->to_string();
    EXPECT_EQ(first.receipt_hash.size(), 64u);

    auto expected = chunking::Commitment::create_for_buffer(bundle, chunking::ArtifactType::Memory);
    ASSERT_TRUE(expected.is_ok());
    EXPECT_EQ(first.root, expected.value().root);

    // Committing the same bundle again is idempotent
    auto second = system->commit_session_bundle("session-42", bundle, device);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(second.receipt_hash, first.receipt_hash);

    auto receipt = system->get_receipt(first.receipt_hash);
    ASSERT_TRUE(receipt.is_ok());
    ASSERT_TRUE(receipt.value().has_value());
    EXPECT_EQ(receipt.value()->kind, artifacts::ReceiptKind::Session);
    EXPECT_EQ(receipt.value()->subject_id, "session-42");

    auto empty = system->commit_session_bundle("session-43", bytes{}, device);
    EXPECT_FALSE(empty.success);
    EXPECT_EQ(empty.error->code(), ErrorCode::EmptyArtifact);
}

TEST_F(VerificationSystemTest, DeviceSecretsKeptInStore) {
    EXPECT_EQ(system->secrets().backend_name(), "encrypted-file");
    ASSERT_TRUE(system->secrets().store_private_key("device", device.secret_key()).is_ok());

    system.reset();
    system = open_system();
    ASSERT_NE(system, nullptr);
    auto loaded = system->secrets().retrieve_private_key("device");
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(*loaded.value(), device.secret_key());
}
