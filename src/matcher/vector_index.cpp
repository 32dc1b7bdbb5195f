// VFACE - Vector Index Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/matcher/vector_index.h"
#include "vface/matcher/similarity.h"
#include "vface/registry/fingerprint.h"
#include "vface/util/logging.h"

#include <algorithm>
#include <cmath>

namespace vface {
namespace matcher {

Result<void> ValidateQuery(const FeatureVector& vector, size_t dimension,
                           double threshold, size_t topK) {
    auto valid = registry::ValidateVector(vector, dimension);
    if (!valid) {
        return valid;
    }
    if (!std::isfinite(threshold) || threshold < -1.0 || threshold > 1.0) {
        return Error(ErrorCode::InvalidArgument, "Threshold must be in [-1, 1]");
    }
    if (topK < 1 || topK > MAX_TOP_K) {
        return Error(ErrorCode::InvalidArgument,
                     "topK must be in [1, " + std::to_string(MAX_TOP_K) + "]");
    }
    return Result<void>::Ok();
}

// ============================================================================
// LinearScanIndex
// ============================================================================

LinearScanIndex::LinearScanIndex(const registry::VectorCipher& cipher, const Config& config)
    : cipher_(cipher), config_(config) {}

void LinearScanIndex::Insert(IndexEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = entry.fingerprint;
    entries_[key] = std::move(entry);
}

bool LinearScanIndex::Remove(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(fingerprint) > 0;
}

void LinearScanIndex::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t LinearScanIndex::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool LinearScanIndex::Contains(const std::string& fingerprint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(fingerprint) > 0;
}

LinearScanIndex::Stats LinearScanIndex::GetStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

Result<std::vector<Match>> LinearScanIndex::Query(const FeatureVector& vector,
                                                  double threshold,
                                                  size_t topK) const {
    auto valid = ValidateQuery(vector, config_.dimension, threshold, topK);
    if (!valid) {
        return valid.GetError();
    }

    std::vector<IndexEntry> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(entries_.size());
        for (const auto& [fp, entry] : entries_) {
            snapshot.push_back(entry);
        }
    }

    struct Scored {
        const IndexEntry* entry;
        double similarity;
    };
    std::vector<Scored> hits;
    uint64_t skipped = 0;

    for (const auto& entry : snapshot) {
        auto stored = cipher_.DecryptVector(entry.payload);
        if (!stored) {
            ++skipped;
            LOG_WARN(util::LogCategory::MATCHER)
                << "Skipping " << util::LogId(entry.fingerprint)
                << ": " << stored.GetError().Message();
            continue;
        }
        if (stored->size() != vector.size()) {
            ++skipped;
            LOG_WARN(util::LogCategory::MATCHER)
                << "Skipping " << util::LogId(entry.fingerprint)
                << ": stored dimension " << stored->size()
                << ", expected " << vector.size();
            continue;
        }

        double similarity = CosineSimilarity(vector, stored.Value());
        std::fill(stored->begin(), stored->end(), 0.0);
        if (similarity >= threshold) {
            hits.push_back({&entry, similarity});
        }
    }

    std::sort(hits.begin(), hits.end(), [](const Scored& a, const Scored& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.entry->sequence < b.entry->sequence;
    });
    if (hits.size() > topK) {
        hits.resize(topK);
    }

    std::vector<Match> matches;
    matches.reserve(hits.size());
    for (const auto& hit : hits) {
        matches.push_back({hit.entry->fingerprint, hit.entry->ownerKey, hit.similarity});
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.queries;
        stats_.scanned += snapshot.size();
        stats_.skipped += skipped;
        stats_.matches += matches.size();
    }

    LogDebugF(util::LogCategory::MATCHER, "Query scanned %zu entries, %zu matches, %llu skipped",
              snapshot.size(), matches.size(), static_cast<unsigned long long>(skipped));
    return matches;
}

} // namespace matcher
} // namespace vface
