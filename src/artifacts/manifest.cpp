#include "manifest.hpp"
#include "crypto/ed25519.hpp"
#include "utils/file_io.hpp"
#include "utils/logger.hpp"
#include "zulu/time_utils.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

namespace zulu::artifacts {

using json = nlohmann::json;

namespace {

Error invalid(const std::string& message) {
    return Error(ErrorCode::ManifestInvalid, message);
}

bool is_hex_of_size(const json& j, size_t byte_len) {
    if (!j.is_string()) return false;
    const auto& s = j.get_ref<const std::string&>();
    if (s.size() != byte_len * 2) return false;
    return from_hex(s).has_value();
}

} // anonymous namespace

Result<Manifest> Manifest::create(
    const std::string& artifact_id,
    const std::string& artifact_version,
    ArtifactType type,
    const std::string& publisher_name,
    const Hash256& root,
    const std::vector<Hash256>& chunk_digests,
    CommitmentStrategy strategy,
    const ManifestOptions& options,
    const keys::KeyPair& key_pair
) {
    if (chunk_digests.empty() || options.size == 0) {
        return Result<Manifest>::Err(ErrorCode::EmptyArtifact, "Cannot create a manifest for an empty artifact");
    }
    if (artifact_id.empty()) {
        return Result<Manifest>::Err(invalid("Artifact id must not be empty"));
    }
    if (options.chunk_size != chunking::chunk_size_for(type)) {
        return Result<Manifest>::Err(invalid(
            "Chunk size " + std::to_string(options.chunk_size) + " does not match artifact type " +
            chunking::artifact_type_to_string(type)));
    }
    if (chunking::chunk_count_for(options.size, options.chunk_size) != chunk_digests.size()) {
        return Result<Manifest>::Err(invalid("Chunk count is inconsistent with artifact size"));
    }

    ZULU_TRY_UNWRAP(expected_root, chunking::Commitment::compute(strategy, chunk_digests));
    if (expected_root != root) {
        return Result<Manifest>::Err(invalid("Root does not match the chunk digests"));
    }

    Manifest manifest;
    manifest.artifact_id = artifact_id;
    manifest.artifact_version = artifact_version;
    manifest.artifact_type = type;
    manifest.publisher.name = publisher_name;
    manifest.publisher.pubkey = key_pair.public_key();
    manifest.strategy = strategy;
    manifest.root = root;
    manifest.chunk_digests = chunk_digests;
    manifest.metadata.size = options.size;
    manifest.metadata.chunk_size = options.chunk_size;
    manifest.metadata.chunk_count = static_cast<uint32_t>(chunk_digests.size());
    manifest.metadata.description = options.description;
    manifest.metadata.created_at = time::now_string();

    manifest.signature = key_pair.sign(manifest.canonical_bytes());

    ZULU_LOG_INFO("Created manifest for {} {} ({} chunks, root {})",
                  artifact_id, artifact_version, manifest.metadata.chunk_count, hash_to_hex(root));
    return Result<Manifest>::Ok(std::move(manifest));
}

Result<Manifest> Manifest::create(
    const std::string& artifact_id,
    const std::string& artifact_version,
    const std::string& publisher_name,
    const chunking::RootCommitment& commitment,
    const std::optional<std::string>& description,
    const keys::KeyPair& key_pair
) {
    ManifestOptions options;
    options.size = commitment.metadata.total_size;
    options.chunk_size = chunking::chunk_size_for(commitment.metadata.artifact_type);
    options.description = description;

    return create(artifact_id, artifact_version, commitment.metadata.artifact_type, publisher_name,
                  commitment.root, commitment.chunk_digests, commitment.strategy, options, key_pair);
}

Result<void> Manifest::validate_structure(const json& j) {
    if (!j.is_object()) {
        return invalid("Manifest must be a JSON object");
    }

    auto string_field = [&](const json& obj, const char* key) {
        return obj.contains(key) && obj.at(key).is_string();
    };
    auto unsigned_field = [&](const json& obj, const char* key) {
        if (!obj.contains(key) || !obj.at(key).is_number_integer()) {
            return false;
        }
        return obj.at(key).is_number_unsigned() || obj.at(key).get<int64_t>() >= 0;
    };

    if (!string_field(j, "version")) {
        return invalid("Missing or non-string field: version");
    }
    if (j.at("version").get<std::string>() != constants::MANIFEST_VERSION) {
        return invalid("Unsupported manifest version: " + j.at("version").get<std::string>());
    }
    for (const char* key : {"artifactId", "artifactVersion", "artifactType", "signature"}) {
        if (!string_field(j, key)) {
            return invalid(std::string("Missing or non-string field: ") + key);
        }
    }
    if (j.at("artifactId").get<std::string>().empty()) {
        return invalid("artifactId must not be empty");
    }
    auto type = chunking::artifact_type_from_string(j.at("artifactType").get<std::string>());
    if (!type) {
        return invalid("Unknown artifact type: " + j.at("artifactType").get<std::string>());
    }
    if (!is_hex_of_size(j.at("signature"), constants::ED25519_SIGNATURE_SIZE)) {
        return invalid("signature must be 128 hex characters");
    }

    // publisher
    if (!j.contains("publisher") || !j.at("publisher").is_object()) {
        return invalid("Missing or non-object field: publisher");
    }
    const auto& publisher = j.at("publisher");
    if (!string_field(publisher, "name") || !string_field(publisher, "pubkey")) {
        return invalid("publisher requires string fields name and pubkey");
    }
    if (!is_hex_of_size(publisher.at("pubkey"), constants::ED25519_PUBLIC_KEY_SIZE)) {
        return invalid("publisher.pubkey must be 64 hex characters");
    }

    // commitment
    if (!j.contains("commitment") || !j.at("commitment").is_object()) {
        return invalid("Missing or non-object field: commitment");
    }
    const auto& commitment = j.at("commitment");
    if (!string_field(commitment, "strategy") || !string_field(commitment, "root")) {
        return invalid("commitment requires string fields strategy and root");
    }
    if (!chunking::strategy_from_string(commitment.at("strategy").get<std::string>())) {
        return invalid("Unknown commitment strategy: " + commitment.at("strategy").get<std::string>());
    }
    if (!is_hex_of_size(commitment.at("root"), constants::BLAKE3_HASH_SIZE)) {
        return invalid("commitment.root must be 64 hex characters");
    }
    if (!commitment.contains("chunkHashes") || !commitment.at("chunkHashes").is_array()) {
        return invalid("commitment.chunkHashes must be an array");
    }
    for (const auto& digest : commitment.at("chunkHashes")) {
        if (!is_hex_of_size(digest, constants::BLAKE3_HASH_SIZE)) {
            return invalid("commitment.chunkHashes entries must be 64 hex characters");
        }
    }

    // metadata
    if (!j.contains("metadata") || !j.at("metadata").is_object()) {
        return invalid("Missing or non-object field: metadata");
    }
    const auto& metadata = j.at("metadata");
    for (const char* key : {"size", "chunkSize", "chunkCount"}) {
        if (!unsigned_field(metadata, key)) {
            return invalid(std::string("metadata.") + key + " must be a non-negative integer");
        }
    }
    if (!string_field(metadata, "createdAt")) {
        return invalid("metadata.createdAt must be a string");
    }
    if (metadata.contains("description") && !metadata.at("description").is_string()) {
        return invalid("metadata.description must be a string");
    }

    // consistency
    uint64_t size = metadata.at("size").get<uint64_t>();
    uint64_t chunk_size = metadata.at("chunkSize").get<uint64_t>();
    uint64_t chunk_count = metadata.at("chunkCount").get<uint64_t>();
    size_t digest_count = commitment.at("chunkHashes").size();

    if (chunk_size != chunking::chunk_size_for(*type)) {
        return invalid("metadata.chunkSize does not match artifact type");
    }
    if (digest_count == 0 || size == 0) {
        return invalid("Manifest describes an empty artifact");
    }
    if (chunk_count != digest_count) {
        return invalid("metadata.chunkCount does not match the number of chunk hashes");
    }
    if (chunking::chunk_count_for(size, static_cast<uint32_t>(chunk_size)) != chunk_count) {
        return invalid("metadata.chunkCount is inconsistent with metadata.size");
    }

    return Result<void>::Ok();
}

Result<Manifest> Manifest::from_json(const json& j) {
    ZULU_TRY(validate_structure(j));

    Manifest manifest;
    manifest.version = j.at("version").get<std::string>();
    manifest.artifact_id = j.at("artifactId").get<std::string>();
    manifest.artifact_version = j.at("artifactVersion").get<std::string>();
    manifest.artifact_type = *chunking::artifact_type_from_string(j.at("artifactType").get<std::string>());

    const auto& publisher = j.at("publisher");
    manifest.publisher.name = publisher.at("name").get<std::string>();
    manifest.publisher.pubkey = *fixed_from_hex<32>(publisher.at("pubkey").get<std::string>());

    const auto& commitment = j.at("commitment");
    manifest.strategy = *chunking::strategy_from_string(commitment.at("strategy").get<std::string>());
    manifest.root = *fixed_from_hex<32>(commitment.at("root").get<std::string>());
    for (const auto& digest : commitment.at("chunkHashes")) {
        manifest.chunk_digests.push_back(*fixed_from_hex<32>(digest.get<std::string>()));
    }

    const auto& metadata = j.at("metadata");
    manifest.metadata.size = metadata.at("size").get<uint64_t>();
    manifest.metadata.chunk_size = metadata.at("chunkSize").get<uint32_t>();
    manifest.metadata.chunk_count = metadata.at("chunkCount").get<uint32_t>();
    manifest.metadata.created_at = metadata.at("createdAt").get<std::string>();
    if (metadata.contains("description")) {
        manifest.metadata.description = metadata.at("description").get<std::string>();
    }

    manifest.signature = *fixed_from_hex<64>(j.at("signature").get<std::string>());
    return Result<Manifest>::Ok(std::move(manifest));
}

Result<Manifest> Manifest::parse(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        return Result<Manifest>::Err(Error(ErrorCode::ManifestInvalid, "Invalid manifest JSON", e.what()));
    }
    return from_json(j);
}

Result<Manifest> Manifest::load_from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Manifest>::Err(ErrorCode::StorageNotFound, "Failed to open manifest: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

json Manifest::to_unsigned_json() const {
    json digests = json::array();
    for (const auto& digest : chunk_digests) {
        digests.push_back(hash_to_hex(digest));
    }

    json meta = {
        {"size", metadata.size},
        {"chunkSize", metadata.chunk_size},
        {"chunkCount", metadata.chunk_count},
        {"createdAt", metadata.created_at}
    };
    if (metadata.description) {
        meta["description"] = *metadata.description;
    }

    return {
        {"version", version},
        {"artifactId", artifact_id},
        {"artifactVersion", artifact_version},
        {"artifactType", chunking::artifact_type_to_string(artifact_type)},
        {"publisher", {
            {"name", publisher.name},
            {"pubkey", to_hex(publisher.pubkey)}
        }},
        {"commitment", {
            {"strategy", chunking::strategy_to_string(strategy)},
            {"root", hash_to_hex(root)},
            {"chunkHashes", digests}
        }},
        {"metadata", meta}
    };
}

json Manifest::to_json() const {
    json j = to_unsigned_json();
    j["signature"] = to_hex(signature);
    return j;
}

std::string Manifest::to_json_string(int indent) const {
    return to_json().dump(indent);
}

Result<void> Manifest::save_to_file(const std::filesystem::path& path) const {
    return utils::atomic_write_file(path, to_json_string());
}

bytes Manifest::canonical_bytes() const {
    // nlohmann::json objects keep keys sorted; dump() without indent is compact
    std::string canonical = to_unsigned_json().dump();
    return bytes(canonical.begin(), canonical.end());
}

bool Manifest::verify_signature() const {
    bool valid = crypto::Ed25519::verify(canonical_bytes(), signature, publisher.pubkey);
    if (!valid) {
        ZULU_LOG_WARN("Manifest signature verification failed for {} {}", artifact_id, artifact_version);
    }
    return valid;
}

bool Manifest::verify_integrity(const std::vector<Hash256>& actual_digests, const Hash256& actual_root) const {
    if (chunk_digests.size() != actual_digests.size()) {
        return false;
    }
    for (size_t i = 0; i < chunk_digests.size(); ++i) {
        if (chunk_digests[i] != actual_digests[i]) {
            return false;
        }
    }
    return root == actual_root;
}

ManifestSummary Manifest::summary() const {
    char size_buf[32];
    std::snprintf(size_buf, sizeof(size_buf), "%.2f MB",
                  static_cast<double>(metadata.size) / (1024.0 * 1024.0));

    ManifestSummary s;
    s.id = artifact_id;
    s.version = artifact_version;
    s.type = chunking::artifact_type_to_string(artifact_type);
    s.publisher = publisher.name;
    s.size = size_buf;
    s.chunks = metadata.chunk_count;
    s.created = metadata.created_at;
    return s;
}

chunking::RootCommitment Manifest::commitment() const {
    chunking::RootCommitment c;
    c.strategy = strategy;
    c.root = root;
    c.chunk_digests = chunk_digests;
    c.metadata.artifact_type = artifact_type;
    c.metadata.total_size = metadata.size;
    c.metadata.chunk_count = metadata.chunk_count;
    c.metadata.timestamp = metadata.created_at;
    return c;
}

} // namespace zulu::artifacts
