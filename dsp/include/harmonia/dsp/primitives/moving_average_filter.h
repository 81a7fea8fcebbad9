// ==============================================================================
// Layer 1: DSP Primitive - Moving Average Filter
// ==============================================================================
// Uniform-kernel FIR smoother with same-length output.
//
// Output i averages the inputs
//   [i + (W-1)/2 - (W-1), i + (W-1)/2]        (integer division)
// which is the centring numpy.convolve(x, ones(W)/W, mode='same') uses.
//
// Constitution Compliance:
// - Principle III: Modern C++ (C++20, enum class, nodiscard)
// - Principle IX: Layer 1 (depends only on Layer 0)
// - Principle XII: Test-First Development
// ==============================================================================

#pragma once

#include <harmonia/dsp/core/sample_sequence.h>
#include <harmonia/dsp/core/status.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <utility>

namespace Harmonia {
namespace DSP {

// =============================================================================
// EdgePolicy Enumeration
// =============================================================================

/// @brief How kernel taps that fall outside the signal are treated.
enum class EdgePolicy : uint8_t {
    ZeroPad = 0,  ///< Missing taps read as 0, divisor stays W (edges droop)
    Truncate      ///< Missing taps are dropped, divisor is the in-range tap count
};

// =============================================================================
// MovingAverageFilter Class
// =============================================================================

/// @brief Same-length moving average over a whole sequence.
///
/// The filter is stateless between calls: each smooth() sees the complete
/// signal, so there is no history to reset. The only configuration is the
/// edge policy.
class MovingAverageFilter {
public:
    MovingAverageFilter() noexcept = default;

    explicit MovingAverageFilter(EdgePolicy policy) noexcept
        : edgePolicy_(policy) {}

    void setEdgePolicy(EdgePolicy policy) noexcept { edgePolicy_ = policy; }

    [[nodiscard]] EdgePolicy edgePolicy() const noexcept { return edgePolicy_; }

    /// @brief Smooth `signal` with a `window`-tap uniform kernel.
    /// @param signal Input samples
    /// @param window Kernel length in taps
    /// @param out Receives signal.size() samples on success; untouched on failure
    /// @return InvalidParameter if window < 1
    /// @note window == 1 returns the input unchanged
    [[nodiscard]] Status smooth(std::span<const double> signal, int window,
                                SampleSequence& out) const;

    /// @brief Convert a real-valued window request to a tap count.
    /// @param value Requested window (must be a finite integer >= 1)
    /// @param window Receives the tap count on success
    /// @return InvalidParameter if value is not a finite integer in [1, INT_MAX]
    [[nodiscard]] static Status windowFromValue(double value, int& window) noexcept;

    /// @brief Number of taps ahead of the output index.
    [[nodiscard]] static constexpr int leadingTaps(int window) noexcept {
        return (window - 1) / 2;
    }

private:
    EdgePolicy edgePolicy_ = EdgePolicy::ZeroPad;
};

// =============================================================================
// Inline Implementation
// =============================================================================

inline Status MovingAverageFilter::smooth(std::span<const double> signal, int window,
                                          SampleSequence& out) const {
    if (window < 1) {
        return Status::InvalidParameter;
    }

    const auto n = static_cast<std::ptrdiff_t>(signal.size());
    const auto taps = static_cast<std::ptrdiff_t>(window);
    const auto lead = static_cast<std::ptrdiff_t>(leadingTaps(window));
    const double scale = 1.0 / static_cast<double>(window);

    SampleSequence smoothed(signal.size());
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        const std::ptrdiff_t hi = std::min(i + lead, n - 1);
        const std::ptrdiff_t lo = std::max(i + lead - (taps - 1), std::ptrdiff_t{0});

        // Direct summation keeps window == 1 bit-exact
        double sum = 0.0;
        for (std::ptrdiff_t k = lo; k <= hi; ++k) {
            sum += signal[static_cast<size_t>(k)];
        }

        if (window == 1) {
            smoothed[static_cast<size_t>(i)] = sum;
        } else if (edgePolicy_ == EdgePolicy::Truncate) {
            // i itself is always in range, so the count is at least 1
            smoothed[static_cast<size_t>(i)] = sum / static_cast<double>(hi - lo + 1);
        } else {
            smoothed[static_cast<size_t>(i)] = sum * scale;
        }
    }

    out = std::move(smoothed);
    return Status::Ok;
}

inline Status MovingAverageFilter::windowFromValue(double value, int& window) noexcept {
    if (!std::isfinite(value) || value < 1.0 ||
        value > static_cast<double>(std::numeric_limits<int>::max()) ||
        std::trunc(value) != value) {
        return Status::InvalidParameter;
    }
    window = static_cast<int>(value);
    return Status::Ok;
}

} // namespace DSP
} // namespace Harmonia
