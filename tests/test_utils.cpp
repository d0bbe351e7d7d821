#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include "zulu/time_utils.hpp"
#include "utils/config.hpp"
#include "utils/file_io.hpp"
#include "crypto/random.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace zulu;

namespace fs = std::filesystem;

class FileIoTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("zulu_utils_test_" + to_hex(crypto::Random::generate(4)));
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST(HexTest, RoundTripAndCase) {
    bytes data = {0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(to_hex(data), "0001abff");

    auto decoded = from_hex("0001ABff");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

TEST(HexTest, RejectsMalformedInput) {
    EXPECT_FALSE(from_hex("abc").has_value());
    EXPECT_FALSE(from_hex("zz").has_value());
    EXPECT_FALSE(fixed_from_hex<4>("0011").has_value());
    EXPECT_THROW(hex_to_hash("1234"), std::runtime_error);
}

TEST(HexTest, HashConversion) {
    Hash256 hash{};
    hash[0] = 0xde;
    hash[31] = 0x01;
    auto hex = hash_to_hex(hash);
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex_to_hash(hex), hash);
}

TEST(ErrorTest, Dispositions) {
    EXPECT_EQ(error_disposition(ErrorCode::NetworkError), Disposition::Retryable);
    EXPECT_EQ(error_disposition(ErrorCode::ResumeStateCorrupt), Disposition::RestartRequired);
    EXPECT_EQ(error_disposition(ErrorCode::RootMismatch), Disposition::RestartRequired);
    EXPECT_EQ(error_disposition(ErrorCode::ChunkHashMismatch), Disposition::Fatal);
    EXPECT_EQ(error_disposition(ErrorCode::KeyRevoked), Disposition::Fatal);

    Error error(ErrorCode::NetworkError, "connection reset");
    EXPECT_FALSE(error.is_fatal());
    EXPECT_NE(error.to_string().find("connection reset"), std::string::npos);
}

TEST(ErrorTest, ResultPropagation) {
    auto inner = []() -> Result<int> {
        return Result<int>::Err(ErrorCode::OutOfRange, "too far");
    };
    auto outer = [&]() -> Result<std::string> {
        ZULU_TRY_UNWRAP(value, inner());
        return Result<std::string>::Ok(std::to_string(value));
    };

    auto result = outer();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::OutOfRange);
    EXPECT_EQ(result.value_or("fallback"), "fallback");

    auto ok = Result<int>::Ok(21).map([](int v) { return v * 2; });
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 42);
}

TEST(TimeTest, IsoRoundTrip) {
    auto tp = time::from_timestamp(1700000000);
    auto str = time::to_string(tp);
    EXPECT_EQ(str, "2023-11-14T22:13:20.000Z");
    EXPECT_EQ(time::to_timestamp(time::from_string(str)), 1700000000u);
}

TEST(TimeTest, RejectsGarbage) {
    EXPECT_THROW(time::from_string("not a time"), std::runtime_error);
}

TEST(ConfigTest, TypedAccess) {
    auto config = utils::Config::load_from_json(R"({
        "trust_policy": "STRICT",
        "expiry_warning_days": 14,
        "resumable": false
    })");

    EXPECT_EQ(config.get<std::string>("trust_policy"), std::optional<std::string>("STRICT"));
    EXPECT_EQ(config.get_or<uint32_t>("expiry_warning_days", 30), 14u);
    EXPECT_FALSE(config.get_or<bool>("resumable", true));
    EXPECT_EQ(config.get_or<std::string>("missing", "default"), "default");

    // Wrong type yields nullopt
    EXPECT_FALSE(config.get<int>("trust_policy").has_value());
}

TEST(ConfigTest, NegativeNumbersNeverBecomeUnsigned) {
    auto config = utils::Config::load_from_json(R"({"days": -1, "count": 7})");
    EXPECT_FALSE(config.get<uint32_t>("days").has_value());
    EXPECT_EQ(config.get_or<uint32_t>("days", 30), 30u);
    EXPECT_EQ(config.get<int>("days"), std::optional<int>(-1));
    EXPECT_EQ(config.get<uint32_t>("count"), std::optional<uint32_t>(7));
}

TEST(ConfigTest, RejectsNonObject) {
    EXPECT_THROW(utils::Config::load_from_json("[1, 2, 3]"), std::runtime_error);
    EXPECT_THROW(utils::Config::load_from_json("{broken"), std::runtime_error);
}

TEST_F(FileIoTest, AtomicWriteAndRead) {
    auto path = test_dir / "record.bin";
    bytes data = {1, 2, 3, 4, 5};

    ASSERT_TRUE(utils::atomic_write_file(path, data).is_ok());
    EXPECT_FALSE(fs::exists(test_dir / "record.bin.tmp"));

    auto read = utils::read_file(path);
    ASSERT_TRUE(read.is_ok());
    EXPECT_EQ(read.value(), data);

    // Overwrite replaces the whole file
    ASSERT_TRUE(utils::atomic_write_file(path, std::string("xy")).is_ok());
    EXPECT_EQ(utils::read_file(path).value(), bytes({'x', 'y'}));
}

TEST_F(FileIoTest, PositionalWrites) {
    auto path = test_dir / "positional.bin";
    auto file = utils::File::open(path, utils::File::Mode::ReadWriteTruncate);
    ASSERT_TRUE(file.is_ok());

    bytes tail = {'b', 'b'};
    bytes head = {'a', 'a'};
    ASSERT_TRUE(file.value().write_at(2, tail.data(), tail.size()).is_ok());
    ASSERT_TRUE(file.value().write_at(0, head.data(), head.size()).is_ok());
    ASSERT_TRUE(file.value().sync().is_ok());
    EXPECT_EQ(file.value().size().value(), 4u);

    bytes buffer(4);
    auto read = file.value().read_at(0, buffer.data(), buffer.size());
    ASSERT_TRUE(read.is_ok());
    EXPECT_EQ(read.value(), 4u);
    EXPECT_EQ(buffer, bytes({'a', 'a', 'b', 'b'}));
}

TEST_F(FileIoTest, MissingFileReportsNotFound) {
    auto result = utils::read_file(test_dir / "nope");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::StorageNotFound);
}

TEST_F(FileIoTest, MoveFile) {
    auto from = test_dir / "from.bin";
    auto to = test_dir / "sub" / "to.bin";
    fs::create_directories(to.parent_path());
    ASSERT_TRUE(utils::atomic_write_file(from, std::string("payload")).is_ok());

    ASSERT_TRUE(utils::move_file(from, to).is_ok());
    EXPECT_FALSE(fs::exists(from));
    EXPECT_EQ(utils::read_file(to).value(), bytes({'p', 'a', 'y', 'l', 'o', 'a', 'd'}));
}

TEST_F(FileIoTest, CopyFailureRemovesPartialDestination) {
    auto dest = test_dir / "copy.bin.moving";

    // A directory opens read-only but fails on the first read
    auto source_dir = test_dir / "not_a_file";
    fs::create_directories(source_dir);
    EXPECT_TRUE(utils::copy_file_synced(source_dir, dest).is_err());
    EXPECT_FALSE(fs::exists(dest));

    EXPECT_TRUE(utils::copy_file_synced(test_dir / "missing.bin", dest).is_err());
    EXPECT_FALSE(fs::exists(dest));

    auto source = test_dir / "source.bin";
    ASSERT_TRUE(utils::atomic_write_file(source, std::string("chunked")).is_ok());
    ASSERT_TRUE(utils::copy_file_synced(source, dest).is_ok());
    EXPECT_EQ(utils::read_file(dest).value(), utils::read_file(source).value());
}
