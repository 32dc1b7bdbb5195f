// VFACE - Hex and Base64url Encoding
// Copyright (c) 2024 VFACE Developers
// MIT License

#ifndef VFACE_CORE_HEX_H
#define VFACE_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vface {

// ============================================================================
// Hex
// ============================================================================

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes. Throws std::invalid_argument on bad input.
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Non-throwing variant of HexToBytes
std::optional<std::vector<uint8_t>> TryHexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

/// Check for exactly `len` lowercase hex characters
bool IsLowerHex(const std::string& str, size_t len);

// ============================================================================
// Base64url (RFC 4648 section 5, no padding)
// ============================================================================

std::string Base64UrlEncode(const uint8_t* data, size_t len);
std::string Base64UrlEncode(const std::string& data);

/// Decode unpadded base64url; nullopt on any invalid character or length
std::optional<std::string> Base64UrlDecode(const std::string& encoded);

} // namespace vface

#endif // VFACE_CORE_HEX_H
