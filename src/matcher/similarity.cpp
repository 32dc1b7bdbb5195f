// VFACE - Vector Similarity Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/matcher/similarity.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace vface {
namespace matcher {

double Norm(const FeatureVector& v) {
    double sum = 0.0;
    for (double x : v) {
        sum += x * x;
    }
    return std::sqrt(sum);
}

double Dot(const FeatureVector& a, const FeatureVector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Dot: vector length mismatch");
    }
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

double CosineSimilarity(const FeatureVector& a, const FeatureVector& b) {
    double dot = Dot(a, b);
    double norms = Norm(a) * Norm(b);
    if (norms == 0.0) {
        return 0.0;
    }
    // Rounding can push parallel vectors fractionally past 1
    return std::max(-1.0, std::min(1.0, dot / norms));
}

} // namespace matcher
} // namespace vface
