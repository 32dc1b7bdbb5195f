// VFACE - SHA256 Hash Function
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Incremental SHA-256 over the OpenSSL EVP interface.

#ifndef VFACE_CRYPTO_SHA256_H
#define VFACE_CRYPTO_SHA256_H

#include "vface/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace vface {

/// SHA-256 hasher
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if the digest context cannot be created
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);
    SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    /// Finalize the hash and write OUTPUT_SIZE bytes to hash
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// SHA-256 of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

/// SHA-256 of the UTF-8 text as 64 lowercase hex characters
std::string SHA256Hex(const std::string& data);

} // namespace vface

#endif // VFACE_CRYPTO_SHA256_H
