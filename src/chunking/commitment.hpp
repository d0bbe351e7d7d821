#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include "chunker.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zulu::chunking {

/**
 * Root commitment strategies. The tag is recorded in every manifest so the
 * scheme can evolve without breaking old manifests.
 */
enum class CommitmentStrategy {
    SimpleConcatV1,  // root = BLAKE3(d0 || d1 || ... || dn-1)
    BaoMerkleV2      // reserved; not implemented
};

const char* strategy_to_string(CommitmentStrategy strategy);
std::optional<CommitmentStrategy> strategy_from_string(const std::string& str);

/**
 * A commitment scheme maps an ordered digest list to a single root
 */
class CommitmentScheme {
public:
    virtual ~CommitmentScheme() = default;

    virtual CommitmentStrategy strategy() const = 0;

    /**
     * Compute the root over the digests in order.
     * Zero digests is an error (EmptyArtifact).
     */
    virtual Result<Hash256> compute(const std::vector<Hash256>& digests) const = 0;
};

class SimpleConcatV1Scheme : public CommitmentScheme {
public:
    CommitmentStrategy strategy() const override { return CommitmentStrategy::SimpleConcatV1; }
    Result<Hash256> compute(const std::vector<Hash256>& digests) const override;
};

/**
 * Placeholder for a Merkle/Bao tree root. Always fails with NotImplemented
 * rather than silently falling back to another scheme.
 */
class BaoMerkleV2Scheme : public CommitmentScheme {
public:
    CommitmentStrategy strategy() const override { return CommitmentStrategy::BaoMerkleV2; }
    Result<Hash256> compute(const std::vector<Hash256>& digests) const override;
};

// Shared, stateless scheme instance for a strategy
const CommitmentScheme& scheme_for(CommitmentStrategy strategy);

struct CommitmentMetadata {
    ArtifactType artifact_type = ArtifactType::Model;
    uint64_t total_size = 0;
    uint32_t chunk_count = 0;
    std::string timestamp;  // ISO 8601
};

struct RootCommitment {
    CommitmentStrategy strategy = CommitmentStrategy::SimpleConcatV1;
    Hash256 root{};
    std::vector<Hash256> chunk_digests;
    CommitmentMetadata metadata;

    // Two commitments are equal iff their roots are bit-identical
    bool operator==(const RootCommitment& other) const { return root == other.root; }
    bool operator!=(const RootCommitment& other) const { return !(*this == other); }
};

class Commitment {
public:
    static Result<Hash256> compute(CommitmentStrategy strategy, const std::vector<Hash256>& digests);

    /**
     * Build a commitment from a chunk list
     */
    static Result<RootCommitment> create(
        const std::vector<Chunk>& chunks,
        ArtifactType type,
        CommitmentStrategy strategy = CommitmentStrategy::SimpleConcatV1
    );

    /**
     * Chunk an in-memory buffer with the type's chunk size and commit to it.
     * Used for session bundles and memory exports.
     */
    static Result<RootCommitment> create_for_buffer(
        const bytes& data,
        ArtifactType type,
        CommitmentStrategy strategy = CommitmentStrategy::SimpleConcatV1
    );

    static Result<RootCommitment> create_for_file(
        const std::filesystem::path& path,
        ArtifactType type,
        CommitmentStrategy strategy = CommitmentStrategy::SimpleConcatV1
    );

    /**
     * Check actual digests against a commitment: same count, every digest
     * equal in order, and the recomputed root equal to the stored root.
     * Any failure, including an unavailable strategy, returns false.
     */
    static bool verify(const RootCommitment& commitment, const std::vector<Hash256>& actual_digests);

    static nlohmann::json to_json(const RootCommitment& commitment);
    static Result<RootCommitment> from_json(const nlohmann::json& j);
};

} // namespace zulu::chunking
