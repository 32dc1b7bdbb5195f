// VFACE - Secure Random Number Generation Header
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Cryptographically secure randomness from OS entropy. Every function
// throws std::runtime_error if the kernel refuses to provide entropy.

#ifndef VFACE_CORE_RANDOM_H
#define VFACE_CORE_RANDOM_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vface {

/// Fill buffer with cryptographically secure random bytes
void GetRandBytes(uint8_t* buf, size_t len);

/// Return `len` random bytes
std::vector<uint8_t> GetRandBytes(size_t len);

/// Random 64-bit unsigned integer
uint64_t GetRandUint64();

/// `len` random bytes as lowercase hex (2*len characters)
std::string GetRandHex(size_t len);

/// Random RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form
std::string GenerateUUID();

} // namespace vface

#endif // VFACE_CORE_RANDOM_H
