// VFACE - Hex and Base64url Encoding Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/core/hex.h"

#include <stdexcept>

namespace vface {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";
    constexpr char B64URL_CHARS[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    inline int Base64UrlValue(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '-') return 62;
        if (c == '_') return 63;
        return -1;
    }
}

// ============================================================================
// Hex
// ============================================================================

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }

    return result;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<uint8_t> result;
    result.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = HexCharToNibble(hex[i]);
        int low = HexCharToNibble(hex[i + 1]);

        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }

        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return result;
}

std::optional<std::vector<uint8_t>> TryHexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }
    for (char c : hex) {
        if (HexCharToNibble(c) < 0) {
            return std::nullopt;
        }
    }
    return HexToBytes(hex);
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.length() % 2 != 0) {
        return false;
    }

    for (char c : str) {
        if (HexCharToNibble(c) < 0) {
            return false;
        }
    }

    return true;
}

bool IsLowerHex(const std::string& str, size_t len) {
    if (str.length() != len) {
        return false;
    }
    for (char c : str) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Base64url
// ============================================================================

std::string Base64UrlEncode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve((len * 4 + 2) / 3);

    size_t i = 0;
    for (; i + 2 < len; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        result.push_back(B64URL_CHARS[(n >> 18) & 63]);
        result.push_back(B64URL_CHARS[(n >> 12) & 63]);
        result.push_back(B64URL_CHARS[(n >> 6) & 63]);
        result.push_back(B64URL_CHARS[n & 63]);
    }

    size_t rest = len - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        result.push_back(B64URL_CHARS[(n >> 18) & 63]);
        result.push_back(B64URL_CHARS[(n >> 12) & 63]);
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        result.push_back(B64URL_CHARS[(n >> 18) & 63]);
        result.push_back(B64URL_CHARS[(n >> 12) & 63]);
        result.push_back(B64URL_CHARS[(n >> 6) & 63]);
    }

    return result;
}

std::string Base64UrlEncode(const std::string& data) {
    return Base64UrlEncode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::optional<std::string> Base64UrlDecode(const std::string& encoded) {
    // A single trailing sextet cannot encode a whole byte
    if (encoded.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string result;
    result.reserve(encoded.size() * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : encoded) {
        int value = Base64UrlValue(c);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    // Leftover bits must be zero for a canonical encoding
    if (bits > 0 && (buffer & ((1u << bits) - 1)) != 0) {
        return std::nullopt;
    }

    return result;
}

} // namespace vface
