#include "commitment.hpp"
#include "crypto/blake3.hpp"
#include "utils/logger.hpp"
#include "zulu/time_utils.hpp"

namespace zulu::chunking {

const char* strategy_to_string(CommitmentStrategy strategy) {
    switch (strategy) {
        case CommitmentStrategy::SimpleConcatV1: return "SimpleConcatV1";
        case CommitmentStrategy::BaoMerkleV2: return "BaoMerkleV2";
    }
    return "SimpleConcatV1";
}

std::optional<CommitmentStrategy> strategy_from_string(const std::string& str) {
    if (str == "SimpleConcatV1") return CommitmentStrategy::SimpleConcatV1;
    if (str == "BaoMerkleV2") return CommitmentStrategy::BaoMerkleV2;
    return std::nullopt;
}

Result<Hash256> SimpleConcatV1Scheme::compute(const std::vector<Hash256>& digests) const {
    if (digests.empty()) {
        return Result<Hash256>::Err(ErrorCode::EmptyArtifact, "Cannot calculate root from zero chunks");
    }
    return Result<Hash256>::Ok(crypto::Blake3::hash_many(digests));
}

Result<Hash256> BaoMerkleV2Scheme::compute(const std::vector<Hash256>& digests) const {
    ZULU_UNUSED(digests);
    return Result<Hash256>::Err(ErrorCode::NotImplemented, "BaoMerkleV2 commitment is not implemented");
}

const CommitmentScheme& scheme_for(CommitmentStrategy strategy) {
    static const SimpleConcatV1Scheme simple_concat;
    static const BaoMerkleV2Scheme bao_merkle;

    switch (strategy) {
        case CommitmentStrategy::SimpleConcatV1: return simple_concat;
        case CommitmentStrategy::BaoMerkleV2: return bao_merkle;
    }
    return simple_concat;
}

Result<Hash256> Commitment::compute(CommitmentStrategy strategy, const std::vector<Hash256>& digests) {
    return scheme_for(strategy).compute(digests);
}

Result<RootCommitment> Commitment::create(
    const std::vector<Chunk>& chunks,
    ArtifactType type,
    CommitmentStrategy strategy
) {
    RootCommitment commitment;
    commitment.strategy = strategy;
    commitment.chunk_digests = Chunker::digests_of(chunks);

    ZULU_TRY_UNWRAP(root, compute(strategy, commitment.chunk_digests));
    commitment.root = root;

    commitment.metadata.artifact_type = type;
    commitment.metadata.total_size = Chunker::total_size_of(chunks);
    commitment.metadata.chunk_count = static_cast<uint32_t>(chunks.size());
    commitment.metadata.timestamp = time::now_string();

    ZULU_LOG_DEBUG("Created {} commitment over {} chunks: {}",
                   strategy_to_string(strategy), chunks.size(), hash_to_hex(root));
    return Result<RootCommitment>::Ok(std::move(commitment));
}

Result<RootCommitment> Commitment::create_for_buffer(
    const bytes& data,
    ArtifactType type,
    CommitmentStrategy strategy
) {
    auto chunks = Chunker::chunk_buffer(data, chunk_size_for(type));
    return create(chunks, type, strategy);
}

Result<RootCommitment> Commitment::create_for_file(
    const std::filesystem::path& path,
    ArtifactType type,
    CommitmentStrategy strategy
) {
    ZULU_TRY_UNWRAP(chunks, Chunker::chunk_file(path, chunk_size_for(type)));
    return create(chunks, type, strategy);
}

bool Commitment::verify(const RootCommitment& commitment, const std::vector<Hash256>& actual_digests) {
    if (commitment.chunk_digests.size() != actual_digests.size()) {
        ZULU_LOG_WARN("Commitment verification failed: expected {} chunks, got {}",
                      commitment.chunk_digests.size(), actual_digests.size());
        return false;
    }

    for (size_t i = 0; i < actual_digests.size(); ++i) {
        if (commitment.chunk_digests[i] != actual_digests[i]) {
            ZULU_LOG_WARN("Commitment verification failed at chunk {}", i);
            return false;
        }
    }

    auto root = compute(commitment.strategy, actual_digests);
    if (root.is_err()) {
        ZULU_LOG_WARN("Commitment verification failed: {}", root.error().to_string());
        return false;
    }
    return root.value() == commitment.root;
}

nlohmann::json Commitment::to_json(const RootCommitment& commitment) {
    nlohmann::json digests = nlohmann::json::array();
    for (const auto& digest : commitment.chunk_digests) {
        digests.push_back(hash_to_hex(digest));
    }

    return {
        {"strategy", strategy_to_string(commitment.strategy)},
        {"root", hash_to_hex(commitment.root)},
        {"chunkHashes", digests},
        {"metadata", {
            {"artifactType", artifact_type_to_string(commitment.metadata.artifact_type)},
            {"totalSize", commitment.metadata.total_size},
            {"chunkCount", commitment.metadata.chunk_count},
            {"timestamp", commitment.metadata.timestamp}
        }}
    };
}

Result<RootCommitment> Commitment::from_json(const nlohmann::json& j) {
    using R = Result<RootCommitment>;
    try {
        RootCommitment commitment;

        auto strategy = strategy_from_string(j.at("strategy").get<std::string>());
        if (!strategy) {
            return R::Err(ErrorCode::InvalidFormat, "Unknown commitment strategy");
        }
        commitment.strategy = *strategy;

        auto root = fixed_from_hex<32>(j.at("root").get<std::string>());
        if (!root) {
            return R::Err(ErrorCode::InvalidFormat, "Invalid commitment root");
        }
        commitment.root = *root;

        for (const auto& item : j.at("chunkHashes")) {
            auto digest = fixed_from_hex<32>(item.get<std::string>());
            if (!digest) {
                return R::Err(ErrorCode::InvalidFormat, "Invalid chunk digest");
            }
            commitment.chunk_digests.push_back(*digest);
        }

        const auto& meta = j.at("metadata");
        auto type = artifact_type_from_string(meta.at("artifactType").get<std::string>());
        if (!type) {
            return R::Err(ErrorCode::InvalidFormat, "Unknown artifact type");
        }
        commitment.metadata.artifact_type = *type;
        commitment.metadata.total_size = meta.at("totalSize").get<uint64_t>();
        commitment.metadata.chunk_count = meta.at("chunkCount").get<uint32_t>();
        commitment.metadata.timestamp = meta.value("timestamp", std::string());

        if (commitment.metadata.chunk_count != commitment.chunk_digests.size()) {
            return R::Err(ErrorCode::InvalidFormat, "Chunk count does not match digest list");
        }
        return R::Ok(std::move(commitment));
    } catch (const nlohmann::json::exception& e) {
        return R::Err(Error(ErrorCode::DeserializationFailed, "Malformed commitment JSON", e.what()));
    }
}

} // namespace zulu::chunking
