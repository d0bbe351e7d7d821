#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include "chunking/chunker.hpp"
#include "chunking/commitment.hpp"
#include "keys/key_pair.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zulu::artifacts {

using chunking::ArtifactType;
using chunking::CommitmentStrategy;

struct Publisher {
    std::string name;
    PublicKey pubkey{};
};

struct ManifestMetadata {
    uint64_t size = 0;
    uint32_t chunk_size = 0;
    uint32_t chunk_count = 0;
    std::optional<std::string> description;
    std::string created_at;  // ISO 8601
};

/**
 * Caller-supplied metadata for Manifest::create
 */
struct ManifestOptions {
    uint64_t size = 0;
    uint32_t chunk_size = 0;
    std::optional<std::string> description;
};

struct ManifestSummary {
    std::string id;
    std::string version;
    std::string type;
    std::string publisher;
    std::string size;     // "12.34 MB"
    uint32_t chunks = 0;
    std::string created;
};

/**
 * Signed artifact manifest (format version 1.0).
 *
 * The signature covers the canonical serialization of every other field:
 * compact JSON with object keys in sorted order. Editing any signed field,
 * including the root or a single chunk digest, invalidates the signature.
 */
struct Manifest {
    std::string version = constants::MANIFEST_VERSION;
    std::string artifact_id;
    std::string artifact_version;
    ArtifactType artifact_type = ArtifactType::Model;
    Publisher publisher;
    CommitmentStrategy strategy = CommitmentStrategy::SimpleConcatV1;
    Hash256 root{};
    std::vector<Hash256> chunk_digests;
    ManifestMetadata metadata;
    Signature signature{};

    /**
     * Build and sign a manifest. The publisher key is the key pair's public key.
     * Rejects zero chunks (EmptyArtifact), a chunk size that does not match
     * the artifact type, a chunk count inconsistent with the size, and a root
     * that does not match the digests (ManifestInvalid).
     */
    static Result<Manifest> create(
        const std::string& artifact_id,
        const std::string& artifact_version,
        ArtifactType type,
        const std::string& publisher_name,
        const Hash256& root,
        const std::vector<Hash256>& chunk_digests,
        CommitmentStrategy strategy,
        const ManifestOptions& options,
        const keys::KeyPair& key_pair
    );

    /**
     * Build and sign a manifest from an existing commitment
     */
    static Result<Manifest> create(
        const std::string& artifact_id,
        const std::string& artifact_version,
        const std::string& publisher_name,
        const chunking::RootCommitment& commitment,
        const std::optional<std::string>& description,
        const keys::KeyPair& key_pair
    );

    /**
     * Check a parsed JSON document against the manifest schema.
     * Unknown top-level fields are ignored.
     */
    static Result<void> validate_structure(const nlohmann::json& j);

    static Result<Manifest> from_json(const nlohmann::json& j);
    static Result<Manifest> parse(const std::string& json_str);
    static Result<Manifest> load_from_file(const std::filesystem::path& path);

    // All fields except the signature
    nlohmann::json to_unsigned_json() const;
    nlohmann::json to_json() const;
    std::string to_json_string(int indent = 2) const;
    Result<void> save_to_file(const std::filesystem::path& path) const;

    /**
     * Bytes covered by the signature
     */
    bytes canonical_bytes() const;

    bool verify_signature() const;

    /**
     * Compare actual digests and root with the committed ones
     */
    bool verify_integrity(const std::vector<Hash256>& actual_digests, const Hash256& actual_root) const;

    ManifestSummary summary() const;

    chunking::RootCommitment commitment() const;
};

} // namespace zulu::artifacts
