#include "mnemonic.hpp"
#include "crypto/random.hpp"
#include "crypto/sha2.hpp"
#include "utils/logger.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sodium.h>

namespace zulu::keys {

Result<Wordlist> Wordlist::load_from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Wordlist>::Err(ErrorCode::StorageNotFound, "Failed to open word list: " + path.string());
    }

    std::vector<std::string> words;
    words.reserve(WORD_COUNT);
    std::string line;
    while (std::getline(file, line)) {
        // Tolerate CRLF files and trailing whitespace
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
            line.pop_back();
        }
        if (!line.empty()) {
            words.push_back(line);
        }
    }
    return from_words(std::move(words));
}

Result<Wordlist> Wordlist::from_words(std::vector<std::string> words) {
    if (words.size() != WORD_COUNT) {
        return Result<Wordlist>::Err(ErrorCode::InvalidArgument,
            "Word list must contain exactly 2048 words, got " + std::to_string(words.size()));
    }

    Wordlist list;
    list.index_.reserve(WORD_COUNT);
    for (size_t i = 0; i < words.size(); ++i) {
        if (words[i].empty()) {
            return Result<Wordlist>::Err(ErrorCode::InvalidArgument, "Word list contains an empty word");
        }
        if (!list.index_.emplace(words[i], static_cast<uint16_t>(i)).second) {
            return Result<Wordlist>::Err(ErrorCode::InvalidArgument,
                                         "Word list contains a duplicate: " + words[i]);
        }
    }
    list.words_ = std::move(words);
    return Result<Wordlist>::Ok(std::move(list));
}

std::filesystem::path Wordlist::default_english_path() {
    const char* override_path = std::getenv("ZULU_WORDLIST");
    if (override_path && *override_path) {
        return override_path;
    }
    return ZULU_WORDLIST_PATH;
}

Result<Wordlist> Wordlist::english() {
    auto path = default_english_path();
    auto list = load_from_file(path);
    if (list.is_err()) {
        ZULU_LOG_ERROR("Failed to load BIP-39 English word list from {}: {}", path.string(),
                       list.error().message());
    }
    return list;
}

std::optional<uint16_t> Wordlist::index_of(const std::string& word) const {
    auto it = index_.find(word);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// Mnemonic

bool Mnemonic::is_valid_word_count(size_t word_count) {
    return word_count >= 12 && word_count <= 24 && word_count % 3 == 0;
}

std::vector<std::string> Mnemonic::split_words(const std::string& mnemonic) {
    std::vector<std::string> words;
    std::istringstream iss(mnemonic);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

Result<std::string> Mnemonic::from_entropy(const Wordlist& wordlist, const bytes& entropy) {
    if (entropy.size() < 16 || entropy.size() > 32 || entropy.size() % 4 != 0) {
        return Result<std::string>::Err(ErrorCode::InvalidArgument,
                                        "Entropy must be 16-32 bytes and a multiple of 4");
    }

    // entropy bits followed by the first ENT/32 bits of SHA-256(entropy)
    Hash256 checksum = crypto::Sha2::sha256(entropy);
    size_t entropy_bits = entropy.size() * 8;
    size_t total_bits = entropy_bits + entropy_bits / 32;

    auto bit_at = [&](size_t bit) -> unsigned {
        const byte source = bit < entropy_bits ? entropy[bit / 8] : checksum[(bit - entropy_bits) / 8];
        return (source >> (7 - bit % 8)) & 1u;
    };

    std::string mnemonic;
    for (size_t word = 0; word < total_bits / 11; ++word) {
        uint16_t index = 0;
        for (size_t b = 0; b < 11; ++b) {
            index = static_cast<uint16_t>((index << 1) | bit_at(word * 11 + b));
        }
        if (!mnemonic.empty()) {
            mnemonic.push_back(' ');
        }
        mnemonic += wordlist.word(index);
    }
    return Result<std::string>::Ok(std::move(mnemonic));
}

Result<std::string> Mnemonic::generate(const Wordlist& wordlist, size_t word_count) {
    if (!is_valid_word_count(word_count)) {
        return Result<std::string>::Err(ErrorCode::InvalidArgument,
                                        "Word count must be 12, 15, 18, 21 or 24");
    }
    bytes entropy = crypto::Random::generate(word_count * 4 / 3);
    auto mnemonic = from_entropy(wordlist, entropy);
    sodium_memzero(entropy.data(), entropy.size());
    return mnemonic;
}

Result<bytes> Mnemonic::to_entropy(const Wordlist& wordlist, const std::string& mnemonic) {
    auto words = split_words(mnemonic);
    if (!is_valid_word_count(words.size())) {
        return Result<bytes>::Err(ErrorCode::InvalidMnemonic,
                                  "Unsupported mnemonic length: " + std::to_string(words.size()) + " words");
    }

    std::vector<bool> bits;
    bits.reserve(words.size() * 11);
    for (const auto& word : words) {
        auto index = wordlist.index_of(word);
        if (!index) {
            return Result<bytes>::Err(ErrorCode::InvalidMnemonic, "Word not in word list");
        }
        for (int b = 10; b >= 0; --b) {
            bits.push_back(((*index >> b) & 1u) != 0);
        }
    }

    size_t checksum_bits = bits.size() / 33;
    size_t entropy_bits = bits.size() - checksum_bits;

    bytes entropy(entropy_bits / 8, 0);
    for (size_t i = 0; i < entropy_bits; ++i) {
        if (bits[i]) {
            entropy[i / 8] |= static_cast<byte>(1u << (7 - i % 8));
        }
    }

    Hash256 checksum = crypto::Sha2::sha256(entropy);
    for (size_t i = 0; i < checksum_bits; ++i) {
        bool expected = ((checksum[i / 8] >> (7 - i % 8)) & 1u) != 0;
        if (bits[entropy_bits + i] != expected) {
            return Result<bytes>::Err(ErrorCode::InvalidMnemonic, "Mnemonic checksum mismatch");
        }
    }
    return Result<bytes>::Ok(std::move(entropy));
}

bool Mnemonic::validate(const Wordlist& wordlist, const std::string& mnemonic) {
    return to_entropy(wordlist, mnemonic).is_ok();
}

bytes Mnemonic::to_seed(const std::string& mnemonic, const std::string& passphrase) {
    std::string normalized;
    for (const auto& word : split_words(mnemonic)) {
        if (!normalized.empty()) {
            normalized.push_back(' ');
        }
        normalized += word;
    }

    std::string salt = "mnemonic" + passphrase;
    bytes password(normalized.begin(), normalized.end());
    bytes seed = crypto::Sha2::pbkdf2_hmac_sha512(
        password, bytes(salt.begin(), salt.end()), PBKDF2_ROUNDS, SEED_SIZE);

    sodium_memzero(password.data(), password.size());
    sodium_memzero(&normalized[0], normalized.size());
    return seed;
}

Result<bytes> Mnemonic::seed_from_mnemonic(
    const Wordlist& wordlist,
    const std::string& mnemonic,
    const std::string& passphrase
) {
    if (!validate(wordlist, mnemonic)) {
        return Result<bytes>::Err(ErrorCode::InvalidMnemonic, "Invalid BIP-39 mnemonic phrase");
    }
    return Result<bytes>::Ok(to_seed(mnemonic, passphrase));
}

Result<SeedPhrase> Mnemonic::derive_seed(
    const Wordlist& wordlist,
    size_t word_count,
    const std::string& passphrase
) {
    ZULU_TRY_UNWRAP(mnemonic, generate(wordlist, word_count));

    SeedPhrase phrase;
    phrase.seed = to_seed(mnemonic, passphrase);
    phrase.mnemonic = std::move(mnemonic);

    ZULU_LOG_DEBUG("Generated {}-word mnemonic", word_count);
    return Result<SeedPhrase>::Ok(std::move(phrase));
}

} // namespace zulu::keys
