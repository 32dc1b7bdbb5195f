// VFACE - Vector Index
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Similarity search over enrolled vectors. The registry talks to the
// VectorIndex interface only; LinearScanIndex is the exact brute-force
// implementation. Entries hold sealed payloads, never plaintext vectors.

#ifndef VFACE_MATCHER_VECTOR_INDEX_H
#define VFACE_MATCHER_VECTOR_INDEX_H

#include "vface/core/error.h"
#include "vface/core/types.h"
#include "vface/registry/vector_cipher.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace vface {
namespace matcher {

/// Largest topK a query may ask for
static constexpr size_t MAX_TOP_K = 100;

/// Default number of results
static constexpr size_t DEFAULT_TOP_K = 1;

// ============================================================================
// Index Types
// ============================================================================

/// One indexed identity
struct IndexEntry {
    std::string fingerprint;
    std::string ownerKey;
    /// Sealed vector payload
    std::string payload;
    /// Insertion order; lower sequence wins similarity ties
    uint64_t sequence{0};
};

/// A query hit
struct Match {
    std::string fingerprint;
    std::string ownerKey;
    double similarity{0.0};
};

/**
 * Search structure over sealed vectors.
 */
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    /// Add or replace the entry for entry.fingerprint
    virtual void Insert(IndexEntry entry) = 0;

    /// Remove an entry; returns false if it was not present
    virtual bool Remove(const std::string& fingerprint) = 0;

    virtual void Clear() = 0;

    virtual size_t Size() const = 0;

    /**
     * Find entries with similarity >= threshold.
     * @param vector Query vector
     * @param threshold Minimum cosine similarity, in [-1, 1]
     * @param topK Maximum results, in [1, MAX_TOP_K]
     * @return Matches ordered by similarity descending, then insertion order
     */
    virtual Result<std::vector<Match>> Query(const FeatureVector& vector,
                                             double threshold,
                                             size_t topK) const = 0;
};

// ============================================================================
// Linear Scan
// ============================================================================

/**
 * Exact search: decrypts and scores every entry.
 *
 * Query copies the entry set under a short lock and does all decryption
 * outside it, so inserts are never blocked by a scan. Entries that fail to
 * decrypt or have the wrong dimension are skipped and logged.
 */
class LinearScanIndex : public VectorIndex {
public:
    struct Config {
        /// Expected vector dimension
        size_t dimension{128};
    };

    struct Stats {
        uint64_t queries{0};
        uint64_t scanned{0};
        uint64_t skipped{0};
        uint64_t matches{0};
    };

    LinearScanIndex(const registry::VectorCipher& cipher, const Config& config);

    void Insert(IndexEntry entry) override;
    bool Remove(const std::string& fingerprint) override;
    void Clear() override;
    size_t Size() const override;

    Result<std::vector<Match>> Query(const FeatureVector& vector,
                                     double threshold,
                                     size_t topK) const override;

    bool Contains(const std::string& fingerprint) const;

    Stats GetStats() const;

private:
    const registry::VectorCipher& cipher_;
    Config config_;

    mutable std::mutex mutex_;
    std::map<std::string, IndexEntry> entries_;

    mutable std::mutex statsMutex_;
    mutable Stats stats_;
};

/// Validate query arguments shared by every index implementation
Result<void> ValidateQuery(const FeatureVector& vector, size_t dimension,
                           double threshold, size_t topK);

} // namespace matcher
} // namespace vface

#endif // VFACE_MATCHER_VECTOR_INDEX_H
