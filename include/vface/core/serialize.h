// VFACE - Serialization Header
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Binary encoding for records persisted in the key-value store.
// Fixed-width integers are little-endian; lengths and counts are
// CompactSize prefixed. Record types opt in with member templates:
//
//     template<typename Stream> void Serialize(Stream& s) const;
//     template<typename Stream> void Unserialize(Stream& s);

#ifndef VFACE_CORE_SERIALIZE_H
#define VFACE_CORE_SERIALIZE_H

#include "vface/core/types.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace vface {

/// Largest length prefix accepted when reading (32 MB)
static constexpr uint64_t MAX_SERIALIZED_LENGTH = 0x02000000;

/// Elements reserved up front when reading a vector
static constexpr uint64_t VECTOR_RESERVE_LIMIT = 65536;

// ============================================================================
// DataStream
// ============================================================================

/// Append-only byte buffer with a read cursor
class DataStream {
public:
    DataStream() = default;
    explicit DataStream(const std::string& data) : buf_(data) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return buf_.size() - pos_; }
    bool empty() const noexcept { return pos_ == buf_.size(); }

    void Write(const void* src, size_t len) {
        buf_.append(static_cast<const char*>(src), len);
    }

    void Read(void* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream: read past end");
        }
        if (len != 0) {
            std::memcpy(dst, buf_.data() + pos_, len);
        }
        pos_ += len;
    }

    /// Unread bytes as a string
    std::string str() const { return buf_.substr(pos_); }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::string buf_;
    size_t pos_ = 0;
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

template<typename Stream, typename UInt>
void WriteLE(Stream& s, UInt value) {
    static_assert(std::is_unsigned<UInt>::value, "WriteLE takes unsigned types");
    uint8_t bytes[sizeof(UInt)];
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(bytes, sizeof(bytes));
}

template<typename UInt, typename Stream>
UInt ReadLE(Stream& s) {
    static_assert(std::is_unsigned<UInt>::value, "ReadLE takes unsigned types");
    uint8_t bytes[sizeof(UInt)];
    s.Read(bytes, sizeof(bytes));
    UInt value = 0;
    for (size_t i = sizeof(UInt); i-- > 0;) {
        value = static_cast<UInt>((value << 8) | bytes[i]);
    }
    return value;
}

// bool, int32_t, uint32_t, int64_t and friends; signed values keep their
// two's complement bit pattern
template<typename Stream, typename Int,
         typename std::enable_if<std::is_integral<Int>::value, int>::type = 0>
void Serialize(Stream& s, Int value) {
    using UInt = typename std::make_unsigned<
        typename std::conditional<std::is_same<Int, bool>::value, uint8_t, Int>::type>::type;
    WriteLE(s, static_cast<UInt>(value));
}

template<typename Stream, typename Int,
         typename std::enable_if<std::is_integral<Int>::value, int>::type = 0>
void Unserialize(Stream& s, Int& value) {
    using UInt = typename std::make_unsigned<
        typename std::conditional<std::is_same<Int, bool>::value, uint8_t, Int>::type>::type;
    value = static_cast<Int>(ReadLE<UInt>(s));
}

/// IEEE-754 bit pattern
template<typename Stream>
void Serialize(Stream& s, double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    WriteLE(s, bits);
}

template<typename Stream>
void Unserialize(Stream& s, double& value) {
    uint64_t bits = ReadLE<uint64_t>(s);
    std::memcpy(&value, &bits, sizeof(bits));
}

// ============================================================================
// CompactSize
// ============================================================================
// One byte below 0xFD; otherwise a marker byte (0xFD, 0xFE, 0xFF) followed
// by a 2, 4 or 8 byte little-endian length. Only the shortest form is valid.

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t n) {
    if (n < 0xFD) {
        WriteLE(s, static_cast<uint8_t>(n));
    } else if (n <= 0xFFFF) {
        WriteLE(s, uint8_t{0xFD});
        WriteLE(s, static_cast<uint16_t>(n));
    } else if (n <= 0xFFFFFFFF) {
        WriteLE(s, uint8_t{0xFE});
        WriteLE(s, static_cast<uint32_t>(n));
    } else {
        WriteLE(s, uint8_t{0xFF});
        WriteLE(s, n);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint64_t n = 0;
    uint64_t minimum = 0;
    switch (uint8_t marker = ReadLE<uint8_t>(s)) {
        case 0xFD: n = ReadLE<uint16_t>(s); minimum = 0xFD; break;
        case 0xFE: n = ReadLE<uint32_t>(s); minimum = 0x10000; break;
        case 0xFF: n = ReadLE<uint64_t>(s); minimum = 0x100000000ULL; break;
        default:   n = marker; break;
    }
    if (n < minimum) {
        throw std::ios_base::failure("ReadCompactSize: non-canonical encoding");
    }
    if (n > MAX_SERIALIZED_LENGTH) {
        throw std::ios_base::failure("ReadCompactSize: length too large");
    }
    return n;
}

// ============================================================================
// Strings, Records and Containers
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    s.Write(str.data(), str.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    str.assign(ReadCompactSize(s), '\0');
    s.Read(&str[0], str.size());
}

template<typename Stream, typename T>
auto Serialize(Stream& s, const T& obj) -> decltype(obj.Serialize(s), void()) {
    obj.Serialize(s);
}

template<typename Stream, typename T>
auto Unserialize(Stream& s, T& obj) -> decltype(obj.Unserialize(s), void()) {
    obj.Unserialize(s);
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& items) {
    WriteCompactSize(s, items.size());
    for (const auto& item : items) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& items) {
    uint64_t count = ReadCompactSize(s);
    items.clear();
    items.reserve(std::min(count, VECTOR_RESERVE_LIMIT));
    while (count-- > 0) {
        items.emplace_back();
        Unserialize(s, items.back());
    }
}

template<typename Stream, typename K, typename V>
void Serialize(Stream& s, const std::map<K, V>& entries) {
    WriteCompactSize(s, entries.size());
    for (const auto& entry : entries) {
        Serialize(s, entry.first);
        Serialize(s, entry.second);
    }
}

template<typename Stream, typename K, typename V>
void Unserialize(Stream& s, std::map<K, V>& entries) {
    uint64_t count = ReadCompactSize(s);
    entries.clear();
    while (count-- > 0) {
        K key;
        Unserialize(s, key);
        Unserialize(s, entries[std::move(key)]);
    }
}

/// Presence flag, then the value when present
template<typename Stream, typename T>
void Serialize(Stream& s, const std::optional<T>& value) {
    Serialize(s, value.has_value());
    if (value) {
        Serialize(s, *value);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::optional<T>& value) {
    bool present = false;
    Unserialize(s, present);
    value.reset();
    if (present) {
        value.emplace();
        Unserialize(s, *value);
    }
}

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace vface

#endif // VFACE_CORE_SERIALIZE_H
