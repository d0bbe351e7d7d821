#include "resume_state.hpp"
#include "crypto/sha2.hpp"
#include "utils/file_io.hpp"
#include "zulu/time_utils.hpp"

namespace zulu::download {

using json = nlohmann::json;

ResumeManifest ResumeManifest::create(
    const std::string& artifact_id,
    const Hash256& expected_root,
    std::vector<uint32_t> verified_chunks,
    std::vector<Hash256> chunk_hashes
) {
    ResumeManifest manifest;
    manifest.artifact_id = artifact_id;
    manifest.expected_root = expected_root;
    manifest.verified_chunks = std::move(verified_chunks);
    manifest.chunk_hashes = std::move(chunk_hashes);
    if (!manifest.verified_chunks.empty()) {
        manifest.last_verified_chunk = manifest.verified_chunks.back();
    }
    manifest.timestamp = time::now_string();
    manifest.checksum = manifest.compute_checksum();
    return manifest;
}

json ResumeManifest::to_unchecked_json() const {
    json hashes = json::array();
    for (const auto& h : chunk_hashes) {
        hashes.push_back(hash_to_hex(h));
    }
    return {
        {"artifactId", artifact_id},
        {"expectedRoot", hash_to_hex(expected_root)},
        {"verifiedChunks", verified_chunks},
        {"chunkHashes", hashes},
        {"lastVerifiedChunk", last_verified_chunk ? json(*last_verified_chunk) : json(nullptr)},
        {"timestamp", timestamp}
    };
}

json ResumeManifest::to_json() const {
    json j = to_unchecked_json();
    j["checksum"] = checksum;
    return j;
}

std::string ResumeManifest::compute_checksum() const {
    return to_hex(crypto::Sha2::sha256(to_unchecked_json().dump()));
}

bool ResumeManifest::checksum_valid() const {
    return !checksum.empty() && compute_checksum() == checksum;
}

bool ResumeManifest::is_contiguous_prefix() const {
    for (size_t i = 0; i < verified_chunks.size(); ++i) {
        if (verified_chunks[i] != i) {
            return false;
        }
    }
    if (verified_chunks.empty()) {
        return !last_verified_chunk.has_value();
    }
    return last_verified_chunk && *last_verified_chunk == verified_chunks.back();
}

Result<ResumeManifest> ResumeManifest::from_json(const json& j) {
    using R = Result<ResumeManifest>;
    try {
        ResumeManifest manifest;
        manifest.artifact_id = j.at("artifactId").get<std::string>();

        auto root = fixed_from_hex<32>(j.at("expectedRoot").get<std::string>());
        if (!root) {
            return R::Err(ErrorCode::ResumeStateCorrupt, "Invalid expected root in resume state");
        }
        manifest.expected_root = *root;

        manifest.verified_chunks = j.at("verifiedChunks").get<std::vector<uint32_t>>();
        for (const auto& h : j.at("chunkHashes")) {
            auto digest = fixed_from_hex<32>(h.get<std::string>());
            if (!digest) {
                return R::Err(ErrorCode::ResumeStateCorrupt, "Invalid chunk hash in resume state");
            }
            manifest.chunk_hashes.push_back(*digest);
        }

        const auto& last = j.at("lastVerifiedChunk");
        if (!last.is_null()) {
            manifest.last_verified_chunk = last.get<uint32_t>();
        }
        manifest.timestamp = j.at("timestamp").get<std::string>();
        manifest.checksum = j.at("checksum").get<std::string>();
        return R::Ok(std::move(manifest));
    } catch (const json::exception& e) {
        return R::Err(Error(ErrorCode::ResumeStateCorrupt, "Malformed resume state", e.what()));
    }
}

Result<std::optional<ResumeManifest>> ResumeManifest::load(const std::filesystem::path& path) {
    using R = Result<std::optional<ResumeManifest>>;
    if (!std::filesystem::exists(path)) {
        return R::Ok(std::nullopt);
    }

    auto data = utils::read_file(path);
    if (data.is_err()) {
        return R::Err(Error(ErrorCode::ResumeStateCorrupt, "Unreadable resume state", data.error().message()));
    }

    json j;
    try {
        j = json::parse(data.value().begin(), data.value().end());
    } catch (const json::parse_error& e) {
        return R::Err(Error(ErrorCode::ResumeStateCorrupt, "Resume state is not valid JSON", e.what()));
    }

    ZULU_TRY_UNWRAP(manifest, from_json(j));
    return R::Ok(std::move(manifest));
}

Result<void> ResumeManifest::save(const std::filesystem::path& path) const {
    return utils::atomic_write_file(path, to_json().dump(2));
}

} // namespace zulu::download
