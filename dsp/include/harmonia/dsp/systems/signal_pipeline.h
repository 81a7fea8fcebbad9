// ==============================================================================
// Layer 3: System Component - SignalPipeline
// ==============================================================================
// Synthesis -> noise -> smoothing chain producing the pure, noisy and
// filtered series for one parameter set.
//
// Layer: 3 (System Component)
// Dependencies: Layer 0 (SignalParameters, Status), Layer 1 (HarmonicSynthesizer,
//               NoiseSource, MovingAverageFilter)
//
// Constitution Compliance:
// - Principle III: Modern C++ (enum class, nodiscard, value semantics)
// - Principle IX: Layered Architecture (Layer 3 depends only on Layer 0-1)
// - Principle XII: Test-First Development
// ==============================================================================

#pragma once

#include <harmonia/dsp/core/sample_sequence.h>
#include <harmonia/dsp/core/signal_parameters.h>
#include <harmonia/dsp/core/status.h>
#include <harmonia/dsp/primitives/harmonic_synthesizer.h>
#include <harmonia/dsp/primitives/moving_average_filter.h>
#include <harmonia/dsp/primitives/noise_source.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

namespace Harmonia {
namespace DSP {

// =============================================================================
// SignalFrame
// =============================================================================

/// @brief One complete recompute result.
///
/// Frames are replaced as a whole; nothing ever edits the series of a frame
/// that has been handed out.
struct SignalFrame {
    SampleSequence pure;
    SampleSequence noisy;
    SampleSequence filtered;
    uint64_t generation = 0;   ///< 0 = nothing computed yet, then 1, 2, ...

    [[nodiscard]] size_t size() const noexcept { return pure.size(); }

    /// @brief True when all three series have `length` samples.
    [[nodiscard]] bool isConsistent(size_t length) const noexcept {
        return pure.size() == length && noisy.size() == length &&
               filtered.size() == length;
    }
};

// =============================================================================
// SignalPipeline Class
// =============================================================================

/// @brief Layer 3 orchestrator for the harmonic/noise/filter chain.
///
/// recompute() runs, in order:
///   1. pure     = synthesize(time, amplitude, frequency, phase)
///   2. noise    = sample(len(time), noiseMean, noiseVariance)
///   3. noisy    = pure + noise
///   4. filtered = smooth(noisy, filterWindow)
///
/// A failure in step 2 or 4 is returned unchanged and the previous frame
/// stays current. Every successful call draws fresh noise, so two calls with
/// the same parameters differ unless the noise source is reseeded in between.
class SignalPipeline {
public:
    // =========================================================================
    // Construction
    // =========================================================================

    /// @brief Pipeline with an entropy-seeded noise source.
    SignalPipeline() = default;

    /// @brief Pipeline with a fixed noise seed.
    explicit SignalPipeline(uint64_t seed, EdgePolicy edgePolicy = EdgePolicy::ZeroPad) noexcept
        : noise_(seed), filter_(edgePolicy) {}

    // Non-copyable (owns generator state), movable
    SignalPipeline(const SignalPipeline&) = delete;
    SignalPipeline& operator=(const SignalPipeline&) = delete;
    SignalPipeline(SignalPipeline&&) noexcept = default;
    SignalPipeline& operator=(SignalPipeline&&) noexcept = default;

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Recompute all three series from `params` over `time`.
    /// @return Ok, or the InvalidParameter reported by the noise or filter step
    /// @post On success frame() holds a new frame with generation + 1
    [[nodiscard]] Status recompute(const SignalParameters& params,
                                   std::span<const double> time);

    // =========================================================================
    // Access
    // =========================================================================

    [[nodiscard]] const SignalFrame& frame() const noexcept { return frame_; }

    [[nodiscard]] bool hasFrame() const noexcept { return frame_.generation != 0; }

    [[nodiscard]] NoiseSource& noiseSource() noexcept { return noise_; }
    [[nodiscard]] const NoiseSource& noiseSource() const noexcept { return noise_; }

    void setEdgePolicy(EdgePolicy policy) noexcept { filter_.setEdgePolicy(policy); }
    [[nodiscard]] EdgePolicy edgePolicy() const noexcept { return filter_.edgePolicy(); }

private:
    NoiseSource noise_;
    MovingAverageFilter filter_;
    SignalFrame frame_;
};

// =============================================================================
// Inline Implementation
// =============================================================================

inline Status SignalPipeline::recompute(const SignalParameters& params,
                                        std::span<const double> time) {
    SignalFrame next;
    next.pure = HarmonicSynthesizer::synthesize(time, params.amplitude, params.frequency,
                                                params.phase);

    SampleSequence noise;
    if (const Status status = noise_.sample(time.size(), params.noiseMean,
                                            params.noiseVariance, noise);
        status != Status::Ok) {
        return status;
    }

    next.noisy = addSequences(next.pure, noise);

    if (const Status status = filter_.smooth(next.noisy, params.filterWindow, next.filtered);
        status != Status::Ok) {
        return status;
    }

    next.generation = frame_.generation + 1;
    frame_ = std::move(next);
    return Status::Ok;
}

} // namespace DSP
} // namespace Harmonia
