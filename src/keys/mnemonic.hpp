#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace zulu::keys {

/**
 * BIP-39 word list: exactly 2048 distinct words, index = 11-bit value.
 * The standard English list ships as data/bip39_english.txt.
 */
class Wordlist {
public:
    static constexpr size_t WORD_COUNT = 2048;

    /**
     * Load a newline-separated word list
     */
    static Result<Wordlist> load_from_file(const std::filesystem::path& path);

    static Result<Wordlist> from_words(std::vector<std::string> words);

    /**
     * The standard English list. Read from $ZULU_WORDLIST when set, else from
     * the path the build configured.
     */
    static Result<Wordlist> english();
    static std::filesystem::path default_english_path();

    const std::string& word(uint16_t index) const { return words_.at(index); }
    std::optional<uint16_t> index_of(const std::string& word) const;
    size_t size() const { return words_.size(); }

private:
    Wordlist() = default;

    std::vector<std::string> words_;
    std::unordered_map<std::string, uint16_t> index_;
};

/**
 * A freshly generated mnemonic together with its 64-byte seed
 */
struct SeedPhrase {
    std::string mnemonic;
    bytes seed;
};

/**
 * BIP-39 mnemonic encoding and seed derivation
 */
class Mnemonic {
public:
    static constexpr uint32_t PBKDF2_ROUNDS = 2048;
    static constexpr size_t SEED_SIZE = 64;

    // 12, 15, 18, 21 or 24 words
    static bool is_valid_word_count(size_t word_count);

    /**
     * Encode 16-32 bytes of entropy (a multiple of 4) as a mnemonic
     */
    static Result<std::string> from_entropy(const Wordlist& wordlist, const bytes& entropy);

    /**
     * Generate a mnemonic from fresh CSPRNG entropy
     */
    static Result<std::string> generate(const Wordlist& wordlist, size_t word_count = 12);

    /**
     * Decode a mnemonic back to entropy, checking word membership and the
     * checksum bits. Fails with InvalidMnemonic.
     */
    static Result<bytes> to_entropy(const Wordlist& wordlist, const std::string& mnemonic);

    static bool validate(const Wordlist& wordlist, const std::string& mnemonic);

    /**
     * PBKDF2-HMAC-SHA512(mnemonic, "mnemonic" + passphrase, 2048) -> 64 bytes.
     * Whitespace in the mnemonic is normalized to single spaces. No validation.
     */
    static bytes to_seed(const std::string& mnemonic, const std::string& passphrase = "");

    /**
     * Validate then derive the seed
     */
    static Result<bytes> seed_from_mnemonic(
        const Wordlist& wordlist,
        const std::string& mnemonic,
        const std::string& passphrase = ""
    );

    /**
     * Generate a new mnemonic and its seed in one step
     */
    static Result<SeedPhrase> derive_seed(
        const Wordlist& wordlist,
        size_t word_count = 12,
        const std::string& passphrase = ""
    );

    // Split on whitespace
    static std::vector<std::string> split_words(const std::string& mnemonic);
};

} // namespace zulu::keys
