// VFACE - Error and Result Types
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Component APIs return Result<T>: either a value or an Error that carries
// a kind (what the caller should do about it) and a precise code.
// Infrastructure errors are the only retryable kind; everything else is
// a definitive answer about the request.

#ifndef VFACE_CORE_ERROR_H
#define VFACE_CORE_ERROR_H

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace vface {

// ============================================================================
// Error Classification
// ============================================================================

enum class ErrorKind {
    Validation,
    Conflict,
    NotFound,
    Authorization,
    Replay,
    Integrity,
    Infrastructure
};

enum class ErrorCode {
    // Validation
    InvalidArgument,
    InvalidFingerprint,
    InvalidOwnerKey,
    DimensionMismatch,
    InvalidVector,
    MalformedCommand,
    FingerprintMismatch,
    // Conflict
    AlreadyRegistered,
    DuplicateIdentity,
    AlreadyRevoked,
    RequestNotPending,
    IdentityRevoked,
    // NotFound
    NotFound,
    // Authorization
    NotOwner,
    ConsentMismatch,
    // Replay
    StaleTimestamp,
    ReplayDetected,
    // Integrity
    DecryptionError,
    ChainBroken,
    CorruptRecord,
    // Infrastructure
    StorageError,
    KeyStoreError,
    RegistryUnavailable
};

/// The kind each code belongs to
ErrorKind KindOf(ErrorCode code);

const char* ErrorKindToString(ErrorKind kind);
const char* ErrorCodeToString(ErrorCode code);

// ============================================================================
// Error
// ============================================================================

class Error {
public:
    using Details = std::map<std::string, std::string>;

    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ErrorKind Kind() const { return KindOf(code_); }
    ErrorCode Code() const { return code_; }
    const std::string& Message() const { return message_; }
    const Details& GetDetails() const { return details_; }

    /// Attach a machine-readable detail (chainable)
    Error& WithDetail(const std::string& key, std::string value) {
        details_[key] = std::move(value);
        return *this;
    }

    bool Is(ErrorCode code) const { return code_ == code; }

    /// Only infrastructure failures may succeed when retried unchanged
    bool IsRetryable() const { return Kind() == ErrorKind::Infrastructure; }

    /// "Conflict/AlreadyRegistered: Identity already registered"
    std::string ToString() const;

private:
    ErrorCode code_;
    std::string message_;
    Details details_;
};

// ============================================================================
// Result
// ============================================================================

/// Thrown by Result::Value() when the result holds an error
class BadResultAccess : public std::logic_error {
public:
    explicit BadResultAccess(const Error& error)
        : std::logic_error("Result holds error: " + error.ToString()) {}
};

template<typename T>
class Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool IsOk() const { return state_.index() == 0; }
    explicit operator bool() const { return IsOk(); }

    T& Value() & {
        Check();
        return std::get<0>(state_);
    }
    const T& Value() const& {
        Check();
        return std::get<0>(state_);
    }
    T&& Value() && {
        Check();
        return std::get<0>(std::move(state_));
    }

    T* operator->() { return &Value(); }
    const T* operator->() const { return &Value(); }

    /// Only valid when !IsOk()
    const Error& GetError() const { return std::get<1>(state_); }

private:
    std::variant<T, Error> state_;

    void Check() const {
        if (state_.index() != 0) {
            throw BadResultAccess(std::get<1>(state_));
        }
    }
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    static Result Ok() { return Result(); }

    bool IsOk() const { return !error_.has_value(); }
    explicit operator bool() const { return IsOk(); }

    const Error& GetError() const { return *error_; }

private:
    std::optional<Error> error_;
};

} // namespace vface

#endif // VFACE_CORE_ERROR_H
