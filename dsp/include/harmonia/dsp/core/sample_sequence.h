// ==============================================================================
// Layer 0: Core Utility - Sample Sequences
// ==============================================================================
// Real-valued sample arrays aligned index-for-index with the time base.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace Harmonia {
namespace DSP {

/// Ordered sequence of samples, one per time-base instant.
using SampleSequence = std::vector<double>;

/// @brief Element-wise sum of two equally sized sequences.
/// @param a First operand
/// @param b Second operand
/// @return a[i] + b[i] for every i < min(a.size(), b.size())
[[nodiscard]] inline SampleSequence addSequences(std::span<const double> a,
                                                 std::span<const double> b) {
    const size_t n = std::min(a.size(), b.size());
    SampleSequence result(n);
    for (size_t i = 0; i < n; ++i) {
        result[i] = a[i] + b[i];
    }
    return result;
}

/// @brief Check that a sequence is strictly increasing.
[[nodiscard]] inline bool isStrictlyIncreasing(std::span<const double> values) noexcept {
    for (size_t i = 1; i < values.size(); ++i) {
        if (!(values[i] > values[i - 1])) {
            return false;
        }
    }
    return true;
}

/// @brief Root-mean-square distance between two sequences.
/// @return sqrt(mean((a[i] - b[i])^2)) over the common length, 0 if empty
[[nodiscard]] inline double rmsDifference(std::span<const double> a,
                                          std::span<const double> b) noexcept {
    const size_t n = std::min(a.size(), b.size());
    if (n == 0) {
        return 0.0;
    }
    double sumSquares = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double diff = a[i] - b[i];
        sumSquares += diff * diff;
    }
    return std::sqrt(sumSquares / static_cast<double>(n));
}

} // namespace DSP
} // namespace Harmonia
