// ==============================================================================
// Layer 1: DSP Primitive - Harmonic Synthesizer
// ==============================================================================
// Pure sinusoid evaluated on an arbitrary time grid:
//   y(t) = A * sin(2*pi*f*t + phi)
//
// Constitution Compliance:
// - Principle III: Modern C++ (C++20, value semantics)
// - Principle IX: Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <harmonia/dsp/core/math_constants.h>
#include <harmonia/dsp/core/sample_sequence.h>

#include <cmath>
#include <cstddef>
#include <span>

namespace Harmonia {
namespace DSP {

/// @brief Stateless sine generator.
///
/// Unlike a phase-accumulating oscillator, every sample is computed directly
/// from its time instant, so a recompute with the same arguments reproduces
/// the same sequence bit for bit. Zero amplitude or frequency is legal.
class HarmonicSynthesizer {
public:
    HarmonicSynthesizer() = delete;

    /// @brief Value of the harmonic at a single instant.
    [[nodiscard]] static double sampleAt(double t, double amplitude, double frequency,
                                         double phase) noexcept {
        return amplitude * std::sin(kTwoPi * frequency * t + phase);
    }

    /// @brief Evaluate the harmonic at every instant of `time`.
    /// @param time Sample instants
    /// @param amplitude Peak amplitude A
    /// @param frequency Frequency f in cycles per time unit
    /// @param phase Initial phase phi in radians
    /// @return One sample per instant, same length as `time`
    [[nodiscard]] static SampleSequence synthesize(std::span<const double> time,
                                                   double amplitude, double frequency,
                                                   double phase) {
        SampleSequence samples(time.size());
        for (size_t i = 0; i < time.size(); ++i) {
            samples[i] = sampleAt(time[i], amplitude, frequency, phase);
        }
        return samples;
    }
};

} // namespace DSP
} // namespace Harmonia
