// VFACE - Identity Record Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/registry/identity.h"
#include "vface/crypto/sha256.h"

namespace vface {
namespace registry {

std::string ComputeCommitment(const std::string& encryptedVector, const std::string& nonceHex) {
    return SHA256Hex(encryptedVector + nonceHex);
}

} // namespace registry
} // namespace vface
