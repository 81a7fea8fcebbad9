// ==============================================================================
// Layer 1: DSP Primitive - Time Base
// ==============================================================================
// Evenly spaced sample instants shared by every signal in the pipeline.
//
// Constitution Compliance:
// - Principle III: Modern C++ (C++20, value semantics)
// - Principle IX: Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <harmonia/dsp/core/sample_sequence.h>

#include <cstddef>

namespace Harmonia {
namespace DSP {

/// @brief Generator for the fixed sample grid.
///
/// Produces `count` instants from `start` to `stop`, both endpoints
/// included. The last instant is written as `stop` exactly so that the
/// grid never overshoots or undershoots through accumulated rounding.
class TimeBase {
public:
    static constexpr double kDefaultStart = 0.0;
    static constexpr double kDefaultStop = 10.0;
    static constexpr size_t kDefaultCount = 1000;

    TimeBase() = delete;

    /// @brief Generate the sample instants.
    /// @param start First instant
    /// @param stop Last instant (inclusive)
    /// @param count Number of instants; 0 gives an empty grid, 1 gives {start}
    [[nodiscard]] static SampleSequence generate(double start = kDefaultStart,
                                                 double stop = kDefaultStop,
                                                 size_t count = kDefaultCount) {
        SampleSequence instants(count);
        if (count == 0) {
            return instants;
        }

        instants[0] = start;
        if (count == 1) {
            return instants;
        }

        const double step = spacing(start, stop, count);
        for (size_t i = 1; i + 1 < count; ++i) {
            instants[i] = start + static_cast<double>(i) * step;
        }
        instants[count - 1] = stop;
        return instants;
    }

    /// @brief Distance between neighbouring instants.
    /// @return (stop - start) / (count - 1), or 0 when count < 2
    [[nodiscard]] static constexpr double spacing(double start, double stop,
                                                  size_t count) noexcept {
        return count < 2 ? 0.0 : (stop - start) / static_cast<double>(count - 1);
    }
};

} // namespace DSP
} // namespace Harmonia
