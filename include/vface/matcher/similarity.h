// VFACE - Vector Similarity
// Copyright (c) 2024 VFACE Developers
// MIT License

#ifndef VFACE_MATCHER_SIMILARITY_H
#define VFACE_MATCHER_SIMILARITY_H

#include "vface/core/types.h"

namespace vface {
namespace matcher {

/// Threshold used by verification searches
static constexpr double DEFAULT_VERIFY_THRESHOLD = 0.85;

/// Threshold above which a new enrollment is treated as a duplicate
static constexpr double DEFAULT_SYBIL_THRESHOLD = 0.92;

/// Euclidean norm
double Norm(const FeatureVector& v);

/// Dot product; vectors must have equal length
double Dot(const FeatureVector& a, const FeatureVector& b);

/**
 * Cosine similarity dot(a,b) / (|a| |b|).
 * @return 0 if either vector has zero magnitude
 * @throws std::invalid_argument if the lengths differ
 */
double CosineSimilarity(const FeatureVector& a, const FeatureVector& b);

} // namespace matcher
} // namespace vface

#endif // VFACE_MATCHER_SIMILARITY_H
