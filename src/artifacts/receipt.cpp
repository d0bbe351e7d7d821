#include "receipt.hpp"
#include "crypto/ed25519.hpp"
#include "crypto/sha2.hpp"
#include "utils/logger.hpp"
#include "zulu/time_utils.hpp"
#include <cctype>

namespace zulu::artifacts {

using json = nlohmann::json;

namespace {

void append(bytes& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
}

template<size_t N>
void append(bytes& out, const fixed_bytes<N>& data) {
    out.insert(out.end(), data.begin(), data.end());
}

std::string receipt_hash(const Hash256& root, const std::string& discriminator, const PublicKey& signer) {
    bytes data;
    append(data, root);
    data.push_back('|');
    append(data, discriminator);
    data.push_back('|');
    append(data, signer);
    return to_hex(crypto::Sha2::sha256(data));
}

} // anonymous namespace

const char* receipt_kind_to_string(ReceiptKind kind) {
    switch (kind) {
        case ReceiptKind::Artifact: return "artifact";
        case ReceiptKind::Session: return "session";
    }
    return "artifact";
}

json Receipt::to_json() const {
    json j = {
        {"kind", receipt_kind_to_string(kind)},
        {"receiptHash", receipt_hash},
        {"root", hash_to_hex(root)},
        {"signerPubkey", to_hex(signer_pubkey)},
        {"signature", to_hex(signature)},
        {"timestamp", timestamp},
        {"metadata", metadata}
    };
    if (kind == ReceiptKind::Artifact) {
        j["artifactId"] = subject_id;
        j["version"] = version;
    } else {
        j["sessionId"] = subject_id;
    }
    return j;
}

Result<Receipt> Receipt::from_json(const json& j) {
    using R = Result<Receipt>;
    try {
        Receipt receipt;
        auto kind = j.at("kind").get<std::string>();
        if (kind == "artifact") {
            receipt.kind = ReceiptKind::Artifact;
            receipt.subject_id = j.at("artifactId").get<std::string>();
            receipt.version = j.at("version").get<std::string>();
        } else if (kind == "session") {
            receipt.kind = ReceiptKind::Session;
            receipt.subject_id = j.at("sessionId").get<std::string>();
        } else {
            return R::Err(ErrorCode::InvalidFormat, "Unknown receipt kind: " + kind);
        }

        receipt.receipt_hash = j.at("receiptHash").get<std::string>();
        auto root = fixed_from_hex<32>(j.at("root").get<std::string>());
        auto signer = fixed_from_hex<32>(j.at("signerPubkey").get<std::string>());
        auto signature = fixed_from_hex<64>(j.at("signature").get<std::string>());
        if (!root || !signer || !signature) {
            return R::Err(ErrorCode::InvalidFormat, "Receipt contains malformed hex fields");
        }
        receipt.root = *root;
        receipt.signer_pubkey = *signer;
        receipt.signature = *signature;
        receipt.timestamp = j.at("timestamp").get<std::string>();
        receipt.metadata = j.value("metadata", json::object());
        return R::Ok(std::move(receipt));
    } catch (const json::exception& e) {
        return R::Err(Error(ErrorCode::DeserializationFailed, "Malformed receipt JSON", e.what()));
    }
}

std::string Receipts::artifact_receipt_hash(const Hash256& root, const std::string& version,
                                            const PublicKey& signer) {
    return receipt_hash(root, version, signer);
}

std::string Receipts::session_receipt_hash(const Hash256& root, const std::string& session_id,
                                           const PublicKey& signer) {
    return receipt_hash(root, session_id, signer);
}

bytes Receipts::signing_message(const Receipt& receipt) {
    bytes message;
    append(message, receipt.subject_id);
    message.push_back('|');
    if (receipt.kind == ReceiptKind::Artifact) {
        append(message, receipt.version);
        message.push_back('|');
    }
    append(message, receipt.root);
    return message;
}

Receipt Receipts::create_artifact_receipt(
    const std::string& artifact_id,
    const std::string& version,
    const Hash256& root,
    const keys::KeyPair& signer,
    const json& metadata
) {
    Receipt receipt;
    receipt.kind = ReceiptKind::Artifact;
    receipt.subject_id = artifact_id;
    receipt.version = version;
    receipt.root = root;
    receipt.signer_pubkey = signer.public_key();
    receipt.signature = signer.sign(signing_message(receipt));
    receipt.receipt_hash = artifact_receipt_hash(root, version, signer.public_key());
    receipt.timestamp = time::now_string();
    receipt.metadata = metadata;
    return receipt;
}

Receipt Receipts::create_session_receipt(
    const std::string& session_id,
    const Hash256& root,
    const keys::KeyPair& signer,
    const json& metadata
) {
    Receipt receipt;
    receipt.kind = ReceiptKind::Session;
    receipt.subject_id = session_id;
    receipt.root = root;
    receipt.signer_pubkey = signer.public_key();
    receipt.signature = signer.sign(signing_message(receipt));
    receipt.receipt_hash = session_receipt_hash(root, session_id, signer.public_key());
    receipt.timestamp = time::now_string();
    receipt.metadata = metadata;
    return receipt;
}

bool Receipts::verify(const Receipt& receipt) {
    if (!crypto::Ed25519::verify(signing_message(receipt), receipt.signature, receipt.signer_pubkey)) {
        ZULU_LOG_WARN("Receipt {} has an invalid signature", receipt.receipt_hash);
        return false;
    }

    std::string expected = receipt.kind == ReceiptKind::Artifact
        ? artifact_receipt_hash(receipt.root, receipt.version, receipt.signer_pubkey)
        : session_receipt_hash(receipt.root, receipt.subject_id, receipt.signer_pubkey);
    return receipt.receipt_hash == expected;
}

bool Receipts::same_content(const Receipt& a, const Receipt& b) {
    return a.kind == b.kind &&
           a.receipt_hash == b.receipt_hash &&
           a.subject_id == b.subject_id &&
           a.version == b.version &&
           a.root == b.root &&
           a.signer_pubkey == b.signer_pubkey &&
           a.signature == b.signature &&
           a.metadata == b.metadata;
}

bool Receipts::is_valid_receipt_hash(const std::string& hash) {
    if (hash.size() != 64) {
        return false;
    }
    for (char c : hash) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

json Receipts::artifact_metadata(
    chunking::ArtifactType type,
    uint64_t size,
    uint32_t chunk_count,
    chunking::CommitmentStrategy strategy
) {
    return {
        {"artifactType", chunking::artifact_type_to_string(type)},
        {"size", size},
        {"chunkCount", chunk_count},
        {"strategy", chunking::strategy_to_string(strategy)}
    };
}

} // namespace zulu::artifacts
