#include "zulu/error.hpp"
#include <sstream>

namespace zulu {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::OutOfRange: return "Out of range";
        case ErrorCode::NotImplemented: return "Not implemented";
        case ErrorCode::Cancelled: return "Cancelled";

        case ErrorCode::CryptoInitFailed: return "Crypto initialization failed";
        case ErrorCode::CryptoSignatureFailed: return "Signature failed";
        case ErrorCode::CryptoVerificationFailed: return "Verification failed";
        case ErrorCode::CryptoEncryptionFailed: return "Encryption failed";
        case ErrorCode::CryptoDecryptionFailed: return "Decryption failed";
        case ErrorCode::CryptoKeyGenerationFailed: return "Key generation failed";
        case ErrorCode::InvalidPublicKey: return "Invalid public key";
        case ErrorCode::InvalidSecretKey: return "Invalid secret key";
        case ErrorCode::InvalidMnemonic: return "Invalid mnemonic";

        case ErrorCode::StorageNotFound: return "Not found in storage";
        case ErrorCode::StorageReadFailed: return "Storage read failed";
        case ErrorCode::StorageWriteFailed: return "Storage write failed";
        case ErrorCode::StorageCorrupted: return "Storage corrupted";
        case ErrorCode::StorageAuthenticationFailed: return "Storage authentication failed";
        case ErrorCode::SecretStoreUnavailable: return "Secret store unavailable";

        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ChunkHashMismatch: return "Chunk hash mismatch";
        case ErrorCode::RootMismatch: return "Root mismatch";
        case ErrorCode::ManifestSignatureError: return "Manifest signature error";
        case ErrorCode::ManifestInvalid: return "Manifest invalid";
        case ErrorCode::UntrustedSigner: return "Untrusted signer";
        case ErrorCode::KeyExpired: return "Key expired";
        case ErrorCode::KeyRevoked: return "Key revoked";
        case ErrorCode::ResumeStateCorrupt: return "Resume state corrupt";
        case ErrorCode::ReceiptCollision: return "Receipt collision";
        case ErrorCode::ReceiptInvalid: return "Receipt invalid";
        case ErrorCode::EmptyArtifact: return "Empty artifact";

        case ErrorCode::SerializationFailed: return "Serialization failed";
        case ErrorCode::DeserializationFailed: return "Deserialization failed";
        case ErrorCode::InvalidFormat: return "Invalid format";

        default: return "Unknown error code";
    }
}

Disposition error_disposition(ErrorCode code) {
    switch (code) {
        case ErrorCode::NetworkError:
            return Disposition::Retryable;
        case ErrorCode::ResumeStateCorrupt:
        case ErrorCode::RootMismatch:
            return Disposition::RestartRequired;
        default:
            return Disposition::Fatal;
    }
}

const char* disposition_to_string(Disposition disposition) {
    switch (disposition) {
        case Disposition::Fatal: return "fatal";
        case Disposition::Retryable: return "retryable";
        case Disposition::RestartRequired: return "restart-required";
    }
    return "fatal";
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace zulu
