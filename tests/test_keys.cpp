#include "keys/mnemonic.hpp"
#include "keys/hd_key.hpp"
#include "keys/key_pair.hpp"
#include "crypto/ed25519.hpp"
#include "zulu/common.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace zulu;
using namespace zulu::keys;

namespace {

bytes seed_from_hex(const std::string& hex) {
    return from_hex(hex).value();
}

const char* ZERO_ENTROPY_MNEMONIC =
    "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about";

} // anonymous namespace

class KeyDerivationTest : public ::testing::Test {
protected:
    Wordlist wordlist = Wordlist::english().value();
};

TEST_F(KeyDerivationTest, WordlistRejectsBadInput) {
    EXPECT_TRUE(Wordlist::from_words({"a", "b"}).is_err());

    std::vector<std::string> duplicated(Wordlist::WORD_COUNT, "same");
    EXPECT_TRUE(Wordlist::from_words(duplicated).is_err());

    EXPECT_TRUE(Wordlist::load_from_file("/nonexistent/english.txt").is_err());
}

TEST_F(KeyDerivationTest, EnglishListShape) {
    ASSERT_EQ(wordlist.size(), Wordlist::WORD_COUNT);
    EXPECT_EQ(wordlist.word(0), "abandon");
    EXPECT_EQ(wordlist.word(1019), "legal");
    EXPECT_EQ(wordlist.word(2047), "zoo");
    EXPECT_EQ(wordlist.index_of("about"), std::optional<uint16_t>(3));
    EXPECT_FALSE(wordlist.index_of("zzz").has_value());
}

TEST_F(KeyDerivationTest, EntropyToMnemonic) {
    auto mnemonic = Mnemonic::from_entropy(wordlist, bytes(16, 0));
    ASSERT_TRUE(mnemonic.is_ok());
    EXPECT_EQ(mnemonic.value(), ZERO_ENTROPY_MNEMONIC);

    auto entropy = Mnemonic::to_entropy(wordlist, mnemonic.value());
    ASSERT_TRUE(entropy.is_ok());
    EXPECT_EQ(entropy.value(), bytes(16, 0));
}

TEST_F(KeyDerivationTest, Bip39SeedVector) {
    auto seed = Mnemonic::seed_from_mnemonic(wordlist, ZERO_ENTROPY_MNEMONIC, "TREZOR");
    ASSERT_TRUE(seed.is_ok());
    EXPECT_EQ(to_hex(seed.value()),
              "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e5349553"
              "1f09a6987599d18264c1e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04");
}

TEST_F(KeyDerivationTest, Bip39EnglishVectors) {
    struct Vector {
        const char* entropy;
        const char* mnemonic;
        const char* seed;
    };
    const Vector vectors[] = {
        {"7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f",
         "legal winner thank year wave sausage worth useful legal winner thank yellow",
         "2e8905819b8723fe2c1d161860e5ee1830318dbf49a83bd451cfb8440c28bd6f"
         "a457fe1296106559a3c80937a1c1069be3a3a5bd381ee6260e8d9739fce1f607"},
        {"80808080808080808080808080808080",
         "letter advice cage absurd amount doctor acoustic avoid letter advice cage above",
         "d71de856f81a8acc65e6fc851a38d4d7ec216fd0796d0a6827a3ad6ed5511a30"
         "fa280f12eb2e47ed2ac03b5c462a0358d18d69fe4f985ec81778c1b370b652a8"},
        {"9e885d952ad362caeb4efe34a8e91bd2",
         "ozone drill grab fiber curtain grace pudding thank cruise elder eight picnic",
         "274ddc525802f7c828d8ef7ddbcdc5304e87ac3535913611fbbfa986d0c9e547"
         "6c91689f9c8a54fd55bd38606aa6a8595ad213d4c9c9f9aca3fb217069a41028"},
    };

    for (const auto& v : vectors) {
        auto mnemonic = Mnemonic::from_entropy(wordlist, from_hex(v.entropy).value());
        ASSERT_TRUE(mnemonic.is_ok());
        EXPECT_EQ(mnemonic.value(), v.mnemonic);

        auto seed = Mnemonic::seed_from_mnemonic(wordlist, v.mnemonic, "TREZOR");
        ASSERT_TRUE(seed.is_ok());
        EXPECT_EQ(to_hex(seed.value()), v.seed);
    }

    // 24 words, 256-bit entropy
    auto long_mnemonic = Mnemonic::from_entropy(
        wordlist, from_hex("f585c11aec520db57dd353c69554b21a89b20fb0650966fa0a9d6f74fd989d8f").value());
    ASSERT_TRUE(long_mnemonic.is_ok());
    EXPECT_EQ(long_mnemonic.value(),
              "void come effort suffer camp survey warrior heavy shoot primary clutch crush "
              "open amazing screen patrol group space point ten exist slush involve unfold");
}

TEST_F(KeyDerivationTest, ChecksumMismatchRejected) {
    // Last word carries the checksum; "abandon" x12 is invalid
    std::string bad;
    for (int i = 0; i < 12; ++i) {
        bad += (i ? " " : "") + std::string("abandon");
    }
    EXPECT_FALSE(Mnemonic::validate(wordlist, bad));

    auto seed = Mnemonic::seed_from_mnemonic(wordlist, bad);
    ASSERT_TRUE(seed.is_err());
    EXPECT_EQ(seed.error().code(), ErrorCode::InvalidMnemonic);

    EXPECT_FALSE(Mnemonic::validate(wordlist, "abandon about"));
}

TEST_F(KeyDerivationTest, GenerateWordCounts) {
    for (size_t count : {12u, 24u}) {
        auto phrase = Mnemonic::derive_seed(wordlist, count);
        ASSERT_TRUE(phrase.is_ok());
        EXPECT_EQ(Mnemonic::split_words(phrase.value().mnemonic).size(), count);
        EXPECT_EQ(phrase.value().seed.size(), Mnemonic::SEED_SIZE);
        EXPECT_TRUE(Mnemonic::validate(wordlist, phrase.value().mnemonic));
    }
    EXPECT_TRUE(Mnemonic::generate(wordlist, 13).is_err());
}

TEST(HdKeyTest, Slip10MasterVector) {
    auto master = HdKey::master_from_seed(seed_from_hex("000102030405060708090a0b0c0d0e0f"));
    ASSERT_TRUE(master.is_ok());
    EXPECT_EQ(to_hex(master.value().chain_code()),
              "90046a93de5380a72b5e45010748567d5ea02bbf6522f979e05c0d8d8ca9fffb");
    EXPECT_EQ(to_hex(master.value().private_key()),
              "2b4be7f19ee27bbf30c667b642d5f4aa69fd169872f8fc3059c08ebae2eb19e7");
    EXPECT_EQ(to_hex(master.value().public_key()),
              "a4b2856bfec510abab89753fac1ac0e1112364e7d250545963f135f2a33188ed");
}

TEST(HdKeyTest, Slip10HardenedChildVector) {
    auto child = HdKey::derive_path(seed_from_hex("000102030405060708090a0b0c0d0e0f"), "m/0'");
    ASSERT_TRUE(child.is_ok());
    EXPECT_EQ(child.value().depth(), 1u);
    EXPECT_EQ(to_hex(child.value().chain_code()),
              "8b59aa11380b624e81507a27fedda59fea6d0b779a778918a2fd3590e16e9c69");
    EXPECT_EQ(to_hex(child.value().private_key()),
              "68e0fe46dfb67e368c75379acec591dad19df3cde26e63b93a8e704f1dade7a3");
    EXPECT_EQ(to_hex(child.value().public_key()),
              "8c8a13df77a28f3445213a0f432fde644acaa215fc72dcdf300d5efaa85d350c");
}

TEST(HdKeyTest, RejectsNonHardenedAndMalformedPaths) {
    auto seed = seed_from_hex("000102030405060708090a0b0c0d0e0f");
    EXPECT_TRUE(HdKey::derive_path(seed, "m/0").is_err());
    EXPECT_TRUE(HdKey::derive_path(seed, "x/0'").is_err());
    EXPECT_TRUE(HdKey::derive_path(seed, "m/abc'").is_err());
    EXPECT_TRUE(HdKey::master_from_seed(bytes(8, 1)).is_err());

    auto parsed = HdKey::parse_path("m/44'/1337H/0h");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().size(), 3u);
    EXPECT_EQ(parsed.value()[1], 1337u | HdKey::HARDENED_OFFSET);
}

TEST(KeyDerivation, DeterministicAndDistinct) {
    bytes seed = Mnemonic::to_seed(ZERO_ENTROPY_MNEMONIC);

    auto a = KeyDerivation::derive(seed, 0, 0);
    auto b = KeyDerivation::derive(seed, 0, 0);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value().public_key(), b.value().public_key());
    EXPECT_EQ(a.value().path(), "m/44'/1337'/0'/0'/0'");

    std::set<std::string> seen;
    for (uint32_t account = 0; account < 3; ++account) {
        for (uint32_t index = 0; index < 3; ++index) {
            auto kp = KeyDerivation::derive(seed, account, index);
            ASSERT_TRUE(kp.is_ok());
            seen.insert(kp.value().key_id());
        }
    }
    EXPECT_EQ(seen.size(), 9u);

    EXPECT_TRUE(KeyDerivation::derive(seed, HdKey::HARDENED_OFFSET, 0).is_err());
}

TEST(KeyPairTest, SignsVerifiably) {
    bytes seed = Mnemonic::to_seed(ZERO_ENTROPY_MNEMONIC);
    auto derived = KeyDerivation::derive(seed, 1, 2);
    ASSERT_TRUE(derived.is_ok());
    const KeyPair& kp = derived.value();

    auto signature = kp.sign(std::string("manifest bytes"));
    EXPECT_TRUE(crypto::Ed25519::verify(std::string("manifest bytes"), signature, kp.public_key()));
    EXPECT_FALSE(crypto::Ed25519::verify(std::string("manifest bytez"), signature, kp.public_key()));
}

TEST(KeyPairTest, MoveKeepsKeyMaterial) {
    auto original = KeyPair::generate();
    PublicKey pk = original.public_key();

    KeyPair moved = std::move(original);
    EXPECT_EQ(moved.public_key(), pk);
    EXPECT_TRUE(crypto::Ed25519::verify(std::string("m"), moved.sign(std::string("m")), pk));
}
