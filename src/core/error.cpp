// VFACE - Error Classification
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/core/error.h"

namespace vface {

ErrorKind KindOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidFingerprint:
        case ErrorCode::InvalidOwnerKey:
        case ErrorCode::DimensionMismatch:
        case ErrorCode::InvalidVector:
        case ErrorCode::MalformedCommand:
        case ErrorCode::FingerprintMismatch:
            return ErrorKind::Validation;

        case ErrorCode::AlreadyRegistered:
        case ErrorCode::DuplicateIdentity:
        case ErrorCode::AlreadyRevoked:
        case ErrorCode::RequestNotPending:
        case ErrorCode::IdentityRevoked:
            return ErrorKind::Conflict;

        case ErrorCode::NotFound:
            return ErrorKind::NotFound;

        case ErrorCode::NotOwner:
        case ErrorCode::ConsentMismatch:
            return ErrorKind::Authorization;

        case ErrorCode::StaleTimestamp:
        case ErrorCode::ReplayDetected:
            return ErrorKind::Replay;

        case ErrorCode::DecryptionError:
        case ErrorCode::ChainBroken:
        case ErrorCode::CorruptRecord:
            return ErrorKind::Integrity;

        case ErrorCode::StorageError:
        case ErrorCode::KeyStoreError:
        case ErrorCode::RegistryUnavailable:
            return ErrorKind::Infrastructure;
    }
    return ErrorKind::Infrastructure;
}

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:     return "Validation";
        case ErrorKind::Conflict:       return "Conflict";
        case ErrorKind::NotFound:       return "NotFound";
        case ErrorKind::Authorization:  return "Authorization";
        case ErrorKind::Replay:         return "Replay";
        case ErrorKind::Integrity:      return "Integrity";
        case ErrorKind::Infrastructure: return "Infrastructure";
    }
    return "Unknown";
}

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:     return "InvalidArgument";
        case ErrorCode::InvalidFingerprint:  return "InvalidFingerprint";
        case ErrorCode::InvalidOwnerKey:     return "InvalidOwnerKey";
        case ErrorCode::DimensionMismatch:   return "DimensionMismatch";
        case ErrorCode::InvalidVector:       return "InvalidVector";
        case ErrorCode::MalformedCommand:    return "MalformedCommand";
        case ErrorCode::FingerprintMismatch: return "FingerprintMismatch";
        case ErrorCode::AlreadyRegistered:   return "AlreadyRegistered";
        case ErrorCode::DuplicateIdentity:   return "DuplicateIdentity";
        case ErrorCode::AlreadyRevoked:      return "AlreadyRevoked";
        case ErrorCode::RequestNotPending:   return "RequestNotPending";
        case ErrorCode::IdentityRevoked:     return "IdentityRevoked";
        case ErrorCode::NotFound:            return "NotFound";
        case ErrorCode::NotOwner:            return "NotOwner";
        case ErrorCode::ConsentMismatch:     return "ConsentMismatch";
        case ErrorCode::StaleTimestamp:      return "StaleTimestamp";
        case ErrorCode::ReplayDetected:      return "ReplayDetected";
        case ErrorCode::DecryptionError:     return "DecryptionError";
        case ErrorCode::ChainBroken:         return "ChainBroken";
        case ErrorCode::CorruptRecord:       return "CorruptRecord";
        case ErrorCode::StorageError:        return "StorageError";
        case ErrorCode::KeyStoreError:       return "KeyStoreError";
        case ErrorCode::RegistryUnavailable: return "RegistryUnavailable";
    }
    return "Unknown";
}

std::string Error::ToString() const {
    std::string out = ErrorKindToString(Kind());
    out += "/";
    out += ErrorCodeToString(code_);
    if (!message_.empty()) {
        out += ": ";
        out += message_;
    }
    return out;
}

} // namespace vface
