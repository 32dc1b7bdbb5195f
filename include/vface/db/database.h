// VFACE - Database Abstraction Layer
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Key-value storage shared by the registry, the hash chain and the consent
// service. LevelDB is the durable backend; an in-memory backend serves
// tests and ephemeral nodes. Every multi-key update goes through a
// WriteBatch so it is applied atomically.

#ifndef VFACE_DB_DATABASE_H
#define VFACE_DB_DATABASE_H

#include "vface/core/error.h"
#include "vface/core/serialize.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <ios>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vface {
namespace db {

// ============================================================================
// Status
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        IO_ERROR = 3,
    };

    Status() : code_(OK) {}
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg) { return Status(CORRUPTION, msg); }
    static Status IOError(const std::string& msg) { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

/**
 * Convert a failed storage status into a registry error.
 * Corruption maps to CorruptRecord; everything else is StorageError.
 */
inline Error ToError(const Status& status, const std::string& context) {
    ErrorCode code = status.IsCorruption() ? ErrorCode::CorruptRecord : ErrorCode::StorageError;
    return Error(code, context + ": " + status.ToString());
}

// ============================================================================
// Slice
// ============================================================================

/// Non-owning view of a byte range
class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    char operator[](size_t n) const { return data_[n]; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    size_t write_buffer_size = 4 * 1024 * 1024;
    int max_open_files = 64;
    /// LRU block cache; 0 disables it
    size_t block_cache_size = 8 * 1024 * 1024;
    /// Bloom filter bits per key; 0 disables it
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    bool verify_checksums = false;
};

struct WriteOptions {
    /// fsync before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/// Puts and deletes applied together or not at all
class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        ops_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        ops_.emplace_back(key.ToString(), std::nullopt);
    }

    size_t Count() const { return ops_.size(); }
    bool Empty() const { return ops_.empty(); }

    /// Visit operations in the order they were added; nullopt is a delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : ops_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> ops_;
};

// ============================================================================
// Iterator
// ============================================================================

/// Forward iterator in key order over a consistent view
class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;

    Status Get(const Slice& key, std::string* value) { return Get(ReadOptions(), key, value); }
    Status Put(const Slice& key, const Slice& value) { return Put(WriteOptions(), key, value); }
    Status Delete(const Slice& key) { return Delete(WriteOptions(), key); }
    Status Write(WriteBatch* batch) { return Write(WriteOptions(), batch); }
    std::unique_ptr<Iterator> NewIterator() { return NewIterator(ReadOptions()); }

    bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }

    /**
     * Visit every key starting with a prefix, in key order.
     * The visitor returns false to stop early.
     * @return Iterator status after the scan
     */
    Status ScanPrefix(const Slice& prefix,
                      const std::function<bool(const Slice& key, const Slice& value)>& visitor);
};

/// Open (or create) a LevelDB database directory
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/**
 * Fresh in-memory database. Iterators read a copy taken when they are
 * created, so writes made during a scan are not observed by it.
 */
std::unique_ptr<Database> OpenMemoryDatabase();

/// Delete a LevelDB database directory's contents
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    ss << obj;
    return ss.str();
}

/// Decode a stored value; short reads and trailing bytes both fail
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(data);
        ss >> obj;
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    } catch (const std::length_error&) {
        return false;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

// ============================================================================
// Key Layout
// ============================================================================

namespace prefix {
    // Registry
    constexpr char IDENTITY = 'i';          // fingerprint -> identity record
    constexpr char OWNER_INDEX = 'o';       // owner key + fingerprint -> ""
    constexpr char NONCE = 'n';             // command nonce -> expiry (unix s)
    constexpr char SEQUENCE = 'S';          // -> last registration sequence

    // Hash chain
    constexpr char CHAIN_ENTRY = 'e';       // big-endian index -> chain entry
    constexpr char CHAIN_TIP = 'T';         // -> latest index
    constexpr char CHAIN_FINGERPRINT = 'f'; // fingerprint -> anchoring entry index

    // Consent
    constexpr char CONSENT_REQUEST = 'q';   // request id -> consent request
    constexpr char CONSENT_ACTIVE = 'a';    // consent id -> active consent
    constexpr char CONSENT_BY_FP = 'A';     // fingerprint + consent id -> ""
}

inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result(1, prefix);
    result.append(key.data(), key.size());
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

/// Prefixed key for an integer index; big-endian so keys sort numerically
inline std::string MakeIndexKey(char prefix, uint64_t index) {
    std::string result(9, '\0');
    result[0] = prefix;
    for (int i = 0; i < 8; ++i) {
        result[1 + i] = static_cast<char>((index >> (56 - 8 * i)) & 0xFF);
    }
    return result;
}

/// Decode the index from a key built by MakeIndexKey
inline std::optional<uint64_t> ParseIndexKey(const Slice& key) {
    if (key.size() != 9) {
        return std::nullopt;
    }
    uint64_t index = 0;
    for (size_t i = 1; i < 9; ++i) {
        index = (index << 8) | static_cast<uint8_t>(key[i]);
    }
    return index;
}

} // namespace db
} // namespace vface

#endif // VFACE_DB_DATABASE_H
