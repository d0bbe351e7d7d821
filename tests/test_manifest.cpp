#include "artifacts/manifest.hpp"
#include "artifacts/receipt.hpp"
#include "chunking/commitment.hpp"
#include "crypto/blake3.hpp"
#include "crypto/random.hpp"
#include "keys/key_pair.hpp"
#include <gtest/gtest.h>
#include <filesystem>

using namespace zulu;
using namespace zulu::artifacts;

namespace fs = std::filesystem;

class ManifestTest : public ::testing::Test {
protected:
    keys::KeyPair publisher = keys::KeyPair::generate();
    bytes artifact;
    chunking::RootCommitment commitment;

    void SetUp() override {
        artifact = crypto::Random::generate(5 * 1000 * 1000);  // 5 MB model
        commitment = chunking::Commitment::create_for_buffer(artifact, ArtifactType::Model).value();
    }

    Manifest make_manifest() {
        auto manifest = Manifest::create("whisper-base", "1.2.0", "Zulu Team", commitment,
                                         std::string("speech model"), publisher);
        EXPECT_TRUE(manifest.is_ok());
        return manifest.value();
    }
};

TEST_F(ManifestTest, CreateAndVerify) {
    auto manifest = make_manifest();
    EXPECT_EQ(manifest.version, "1.0");
    EXPECT_EQ(manifest.metadata.chunk_count, 5u);
    EXPECT_EQ(manifest.metadata.chunk_size, 1048576u);
    EXPECT_EQ(manifest.publisher.pubkey, publisher.public_key());
    EXPECT_TRUE(manifest.verify_signature());
    EXPECT_TRUE(manifest.verify_integrity(commitment.chunk_digests, commitment.root));
}

TEST_F(ManifestTest, EditingAnySignedFieldBreaksSignature) {
    auto manifest = make_manifest();

    auto root_edit = manifest;
    root_edit.root[0] ^= 0x01;
    EXPECT_FALSE(root_edit.verify_signature());

    auto digest_edit = manifest;
    digest_edit.chunk_digests[3][10] ^= 0x80;
    EXPECT_FALSE(digest_edit.verify_signature());

    auto version_edit = manifest;
    version_edit.artifact_version = "1.2.1";
    EXPECT_FALSE(version_edit.verify_signature());

    auto publisher_edit = manifest;
    publisher_edit.publisher.pubkey = keys::KeyPair::generate().public_key();
    EXPECT_FALSE(publisher_edit.verify_signature());

    auto signature_edit = manifest;
    signature_edit.signature[5] ^= 0x10;
    EXPECT_FALSE(signature_edit.verify_signature());
}

TEST_F(ManifestTest, BitFlipInArtifactFailsIntegrity) {
    auto manifest = make_manifest();

    bytes tampered = artifact;
    tampered[3 * 1048576 + 17] ^= 0x01;  // inside chunk 3

    auto actual = chunking::Commitment::create_for_buffer(tampered, ArtifactType::Model).value();
    EXPECT_NE(actual.chunk_digests[3], manifest.chunk_digests[3]);
    EXPECT_EQ(actual.chunk_digests[2], manifest.chunk_digests[2]);
    EXPECT_FALSE(manifest.verify_integrity(actual.chunk_digests, actual.root));
}

TEST_F(ManifestTest, FirstBitFlipChangesOnlyFirstDigestAndRoot) {
    auto manifest = make_manifest();

    bytes tampered = artifact;
    tampered[0] ^= 0x01;

    auto actual = chunking::Commitment::create_for_buffer(tampered, ArtifactType::Model).value();
    ASSERT_EQ(actual.chunk_digests.size(), manifest.chunk_digests.size());
    EXPECT_NE(actual.chunk_digests[0], manifest.chunk_digests[0]);
    for (size_t i = 1; i < actual.chunk_digests.size(); ++i) {
        EXPECT_EQ(actual.chunk_digests[i], manifest.chunk_digests[i]) << "chunk " << i;
    }
    EXPECT_NE(actual.root, manifest.root);
    EXPECT_FALSE(manifest.verify_integrity(actual.chunk_digests, actual.root));
}

TEST_F(ManifestTest, IntegrityNeedsMatchingRootToo) {
    auto manifest = make_manifest();
    Hash256 wrong_root = commitment.root;
    wrong_root[31] ^= 0x01;
    EXPECT_FALSE(manifest.verify_integrity(commitment.chunk_digests, wrong_root));

    auto fewer = commitment.chunk_digests;
    fewer.pop_back();
    EXPECT_FALSE(manifest.verify_integrity(fewer, commitment.root));
}

TEST_F(ManifestTest, JsonRoundTripPreservesSignature) {
    auto manifest = make_manifest();
    auto parsed = Manifest::parse(manifest.to_json_string());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().verify_signature());
    EXPECT_EQ(parsed.value().canonical_bytes(), manifest.canonical_bytes());

    auto j = manifest.to_json();
    EXPECT_EQ(j.at("artifactType"), "MODEL");
    EXPECT_EQ(j.at("commitment").at("strategy"), "SimpleConcatV1");
    EXPECT_EQ(j.at("commitment").at("chunkHashes").size(), 5u);
}

TEST_F(ManifestTest, UnknownFieldsIgnoredUnknownVersionRejected) {
    auto j = make_manifest().to_json();

    auto extended = j;
    extended["futureField"] = {{"x", 1}};
    auto parsed = Manifest::from_json(extended);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().verify_signature());

    auto future = j;
    future["version"] = "2.0";
    auto rejected = Manifest::from_json(future);
    ASSERT_TRUE(rejected.is_err());
    EXPECT_EQ(rejected.error().code(), ErrorCode::ManifestInvalid);
}

TEST_F(ManifestTest, StructureValidationIsDistinctFromSignature) {
    auto j = make_manifest().to_json();

    auto missing = j;
    missing.erase("publisher");
    EXPECT_EQ(Manifest::validate_structure(missing).error().code(), ErrorCode::ManifestInvalid);

    auto wrong_type = j;
    wrong_type["metadata"]["size"] = "big";
    EXPECT_TRUE(Manifest::validate_structure(wrong_type).is_err());

    auto bad_hex = j;
    bad_hex["commitment"]["root"] = "xyz";
    EXPECT_TRUE(Manifest::validate_structure(bad_hex).is_err());

    auto bad_type = j;
    bad_type["artifactType"] = "FIRMWARE";
    EXPECT_TRUE(Manifest::validate_structure(bad_type).is_err());

    EXPECT_TRUE(Manifest::parse("{not json").is_err());
    EXPECT_TRUE(Manifest::validate_structure(nlohmann::json::array()).is_err());
}

TEST_F(ManifestTest, CreateRejectsInconsistentInput) {
    ManifestOptions options;
    options.size = artifact.size();
    options.chunk_size = 65536;  // wrong for MODEL
    auto wrong_size = Manifest::create("id", "1", ArtifactType::Model, "pub", commitment.root,
                                       commitment.chunk_digests, CommitmentStrategy::SimpleConcatV1,
                                       options, publisher);
    ASSERT_TRUE(wrong_size.is_err());
    EXPECT_EQ(wrong_size.error().code(), ErrorCode::ManifestInvalid);

    options.chunk_size = 1048576;
    Hash256 bogus_root = commitment.root;
    bogus_root[0] ^= 1;
    auto wrong_root = Manifest::create("id", "1", ArtifactType::Model, "pub", bogus_root,
                                       commitment.chunk_digests, CommitmentStrategy::SimpleConcatV1,
                                       options, publisher);
    ASSERT_TRUE(wrong_root.is_err());

    auto empty = Manifest::create("id", "1", ArtifactType::Model, "pub", commitment.root, {},
                                  CommitmentStrategy::SimpleConcatV1, options, publisher);
    ASSERT_TRUE(empty.is_err());
    EXPECT_EQ(empty.error().code(), ErrorCode::EmptyArtifact);
}

TEST_F(ManifestTest, SaveAndLoad) {
    auto dir = fs::temp_directory_path() / ("zulu_manifest_test_" + to_hex(crypto::Random::generate(4)));
    fs::create_directories(dir);

    auto manifest = make_manifest();
    ASSERT_TRUE(manifest.save_to_file(dir / "manifest.json").is_ok());

    auto loaded = Manifest::load_from_file(dir / "manifest.json");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value().verify_signature());
    EXPECT_EQ(loaded.value().summary().chunks, 5u);
    EXPECT_EQ(loaded.value().summary().size, "4.77 MB");

    fs::remove_all(dir);
}

// Receipts

TEST(ReceiptTest, HashIsContentAddressed) {
    auto signer = keys::KeyPair::generate();
    Hash256 root = crypto::Blake3::hash(std::string("artifact"));

    auto a = Receipts::create_artifact_receipt("model", "1.0", root, signer);
    auto b = Receipts::create_artifact_receipt("model", "1.0", root, signer);
    EXPECT_EQ(a.receipt_hash, b.receipt_hash);
    EXPECT_EQ(a.receipt_hash, Receipts::artifact_receipt_hash(root, "1.0", signer.public_key()));
    EXPECT_TRUE(Receipts::is_valid_receipt_hash(a.receipt_hash));

    auto other_version = Receipts::create_artifact_receipt("model", "1.1", root, signer);
    EXPECT_NE(a.receipt_hash, other_version.receipt_hash);
}

TEST(ReceiptTest, VerifyDetectsTampering) {
    auto signer = keys::KeyPair::generate();
    Hash256 root = crypto::Blake3::hash(std::string("bundle"));

    auto receipt = Receipts::create_session_receipt("session-42", root, signer);
    EXPECT_TRUE(Receipts::verify(receipt));

    auto forged_root = receipt;
    forged_root.root[0] ^= 1;
    EXPECT_FALSE(Receipts::verify(forged_root));

    auto forged_hash = receipt;
    forged_hash.receipt_hash[0] = forged_hash.receipt_hash[0] == 'a' ? 'b' : 'a';
    EXPECT_FALSE(Receipts::verify(forged_hash));
}

TEST(ReceiptTest, JsonRoundTrip) {
    auto signer = keys::KeyPair::generate();
    Hash256 root = crypto::Blake3::hash(std::string("artifact"));
    auto receipt = Receipts::create_artifact_receipt(
        "model", "2.0", root, signer,
        Receipts::artifact_metadata(ArtifactType::Model, 1024, 1, CommitmentStrategy::SimpleConcatV1));

    auto parsed = Receipt::from_json(receipt.to_json());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(Receipts::same_content(parsed.value(), receipt));
    EXPECT_TRUE(Receipts::verify(parsed.value()));
}
