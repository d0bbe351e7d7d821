#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include "chunking/chunker.hpp"
#include "chunking/commitment.hpp"
#include "keys/key_pair.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace zulu::artifacts {

enum class ReceiptKind {
    Artifact,
    Session
};

const char* receipt_kind_to_string(ReceiptKind kind);

/**
 * Signed, content-addressed record that a root was verified (artifact) or
 * committed (session). The receipt hash identifies the receipt:
 *   artifact: SHA-256(root || "|" || version || "|" || signer_pubkey)
 *   session:  SHA-256(root || "|" || session_id || "|" || signer_pubkey)
 */
struct Receipt {
    ReceiptKind kind = ReceiptKind::Artifact;
    std::string receipt_hash;     // lowercase hex
    std::string subject_id;       // artifact id or session id
    std::string version;          // artifact version; empty for sessions
    Hash256 root{};
    PublicKey signer_pubkey{};
    Signature signature{};
    std::string timestamp;        // ISO 8601
    nlohmann::json metadata = nlohmann::json::object();  // chain of custody

    nlohmann::json to_json() const;
    static Result<Receipt> from_json(const nlohmann::json& j);
};

class Receipts {
public:
    static std::string artifact_receipt_hash(const Hash256& root, const std::string& version,
                                             const PublicKey& signer);
    static std::string session_receipt_hash(const Hash256& root, const std::string& session_id,
                                            const PublicKey& signer);

    /**
     * Message covered by the signature:
     *   artifact: id || "|" || version || "|" || root
     *   session:  session_id || "|" || root
     */
    static bytes signing_message(const Receipt& receipt);

    static Receipt create_artifact_receipt(
        const std::string& artifact_id,
        const std::string& version,
        const Hash256& root,
        const keys::KeyPair& signer,
        const nlohmann::json& metadata = nlohmann::json::object()
    );

    static Receipt create_session_receipt(
        const std::string& session_id,
        const Hash256& root,
        const keys::KeyPair& signer,
        const nlohmann::json& metadata = nlohmann::json::object()
    );

    /**
     * Check the signature and recompute the receipt hash
     */
    static bool verify(const Receipt& receipt);

    /**
     * True when every field except the timestamp matches
     */
    static bool same_content(const Receipt& a, const Receipt& b);

    // 64 hex characters
    static bool is_valid_receipt_hash(const std::string& hash);

    // Chain-of-custody metadata recorded on artifact receipts
    static nlohmann::json artifact_metadata(
        chunking::ArtifactType type,
        uint64_t size,
        uint32_t chunk_count,
        chunking::CommitmentStrategy strategy
    );
};

} // namespace zulu::artifacts
