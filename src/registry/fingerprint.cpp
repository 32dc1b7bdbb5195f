// VFACE - Fingerprint Derivation Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/registry/fingerprint.h"
#include "vface/core/hex.h"
#include "vface/crypto/sha256.h"

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace vface {
namespace registry {

// ============================================================================
// Helpers
// ============================================================================

Result<void> ValidateVector(const FeatureVector& vector, size_t dimension) {
    if (vector.size() != dimension) {
        return Error(ErrorCode::DimensionMismatch,
                     "Expected " + std::to_string(dimension) + " dimensions, got " +
                     std::to_string(vector.size()));
    }

    double sumSquares = 0.0;
    for (double v : vector) {
        if (!std::isfinite(v)) {
            return Error(ErrorCode::InvalidVector, "Vector contains NaN or infinity");
        }
        sumSquares += v * v;
    }
    if (sumSquares == 0.0 || !std::isfinite(sumSquares)) {
        return Error(ErrorCode::InvalidVector, "Vector has no usable magnitude");
    }
    return Result<void>::Ok();
}

FeatureVector L2Normalize(const FeatureVector& vector) {
    double sumSquares = 0.0;
    for (double v : vector) {
        sumSquares += v * v;
    }
    double magnitude = std::sqrt(sumSquares);

    FeatureVector out;
    out.reserve(vector.size());
    for (double v : vector) {
        out.push_back(v / magnitude);
    }
    return out;
}

std::string FormatQuantized(double value, int precision) {
    // Exact decimal expansion of |value|; every finite double fits in 1100 places
    double magnitude = std::fabs(value);
    int len = std::snprintf(nullptr, 0, "%.1100f", magnitude);
    if (len <= 0) {
        throw std::runtime_error("FormatQuantized: formatting failed");
    }
    std::string text(static_cast<size_t>(len) + 1, '\0');
    std::snprintf(&text[0], text.size(), "%.1100f", magnitude);
    text.resize(static_cast<size_t>(len));

    size_t point = text.find('.');
    std::string digits = text.substr(0, point) + text.substr(point + 1, precision);
    size_t intLen = point;
    bool roundUp = text[point + 1 + precision] >= '5';

    if (roundUp) {
        size_t i = digits.size();
        while (i > 0) {
            --i;
            if (digits[i] == '9') {
                digits[i] = '0';
            } else {
                ++digits[i];
                break;
            }
            if (i == 0) {
                digits.insert(digits.begin(), '1');
                ++intLen;
            }
        }
    }

    std::string intPart = digits.substr(0, intLen);
    std::string fracPart = digits.substr(intLen);

    size_t firstNonZero = intPart.find_first_not_of('0');
    intPart = (firstNonZero == std::string::npos) ? "0" : intPart.substr(firstNonZero);

    size_t lastNonZero = fracPart.find_last_not_of('0');
    fracPart = (lastNonZero == std::string::npos) ? "" : fracPart.substr(0, lastNonZero + 1);

    std::string result = fracPart.empty() ? intPart : intPart + "." + fracPart;
    if (result == "0") {
        return result;
    }
    return value < 0 ? "-" + result : result;
}

bool IsValidFingerprint(const std::string& fingerprint) {
    return IsLowerHex(fingerprint, FINGERPRINT_HEX_SIZE);
}

// ============================================================================
// FingerprintDeriver
// ============================================================================

FingerprintDeriver::FingerprintDeriver(const Config& config) : config_(config) {
    if (config_.dimension == 0) {
        throw std::invalid_argument("Fingerprint dimension must be positive");
    }
    if (config_.precision < 0 || config_.precision > MAX_PRECISION) {
        throw std::invalid_argument("Fingerprint precision must be in [0, " +
                                    std::to_string(MAX_PRECISION) + "]");
    }
}

Result<std::string> FingerprintDeriver::Canonicalize(const FeatureVector& vector) const {
    auto valid = ValidateVector(vector, config_.dimension);
    if (!valid) {
        return valid.GetError();
    }

    FeatureVector normalized = L2Normalize(vector);

    std::string out;
    out.reserve(normalized.size() * 8 + 2);
    out.push_back('[');
    for (size_t i = 0; i < normalized.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out += FormatQuantized(normalized[i], config_.precision);
    }
    out.push_back(']');
    return out;
}

Result<std::string> FingerprintDeriver::Derive(const FeatureVector& vector) const {
    auto canonical = Canonicalize(vector);
    if (!canonical) {
        return canonical.GetError();
    }
    return SHA256Hex(canonical.Value());
}

} // namespace registry
} // namespace vface
