// VFACE - Core Types Header
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Aliases and small value types used across the registry.

#ifndef VFACE_CORE_TYPES_H
#define VFACE_CORE_TYPES_H

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vface {

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

/// Unix epoch seconds
using Timestamp = int64_t;

/// Unix epoch milliseconds; record and chain timestamps use this
using TimestampMs = int64_t;

/// Embedding produced by the face model, one double per dimension
using FeatureVector = std::vector<double>;

inline Timestamp GetTime() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

inline TimestampMs GetTimeMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

/// 32-byte SHA-256 digest, zero-initialized
class Hash256 {
public:
    static constexpr size_t SIZE = 32;

    Hash256() { bytes_.fill(0); }

    bool IsNull() const {
        return std::all_of(bytes_.begin(), bytes_.end(), [](Byte b) { return b == 0; });
    }

    constexpr size_t size() const { return SIZE; }
    Byte* data() { return bytes_.data(); }
    const Byte* data() const { return bytes_.data(); }

    Byte& operator[](size_t i) { return bytes_[i]; }
    Byte operator[](size_t i) const { return bytes_[i]; }

    bool operator==(const Hash256& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Hash256& other) const { return bytes_ != other.bytes_; }

    /// Lowercase hex, first byte first
    std::string ToHex() const {
        static const char digits[] = "0123456789abcdef";
        std::string hex(SIZE * 2, '0');
        for (size_t i = 0; i < SIZE; ++i) {
            hex[2 * i] = digits[bytes_[i] >> 4];
            hex[2 * i + 1] = digits[bytes_[i] & 0x0F];
        }
        return hex;
    }

private:
    std::array<Byte, SIZE> bytes_;
};

} // namespace vface

#endif // VFACE_CORE_TYPES_H
