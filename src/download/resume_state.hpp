#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zulu::download {

/**
 * On-disk record of download progress, kept next to the partial file.
 *
 * checksum = hex SHA-256 over the compact, key-sorted JSON of every other
 * field. It detects a corrupted or hand-edited resume file; it does not
 * authenticate the partial file itself (the downloader re-verifies chunks
 * for that).
 */
struct ResumeManifest {
    std::string artifact_id;
    Hash256 expected_root{};
    std::vector<uint32_t> verified_chunks;
    std::vector<Hash256> chunk_hashes;
    std::optional<uint32_t> last_verified_chunk;
    std::string timestamp;  // ISO 8601
    std::string checksum;

    static ResumeManifest create(
        const std::string& artifact_id,
        const Hash256& expected_root,
        std::vector<uint32_t> verified_chunks,
        std::vector<Hash256> chunk_hashes
    );

    nlohmann::json to_unchecked_json() const;
    nlohmann::json to_json() const;

    std::string compute_checksum() const;
    bool checksum_valid() const;

    /**
     * True when verified_chunks is exactly 0..K-1 and
     * last_verified_chunk agrees
     */
    bool is_contiguous_prefix() const;

    static Result<ResumeManifest> from_json(const nlohmann::json& j);

    /**
     * nullopt when no resume file exists; ResumeStateCorrupt when it
     * exists but cannot be parsed
     */
    static Result<std::optional<ResumeManifest>> load(const std::filesystem::path& path);

    Result<void> save(const std::filesystem::path& path) const;
};

} // namespace zulu::download
