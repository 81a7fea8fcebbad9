// ==============================================================================
// Layer 0: Core Utilities
// random.h - Seedable Pseudo-Random Number Generation
// ==============================================================================
// Constitution Principle III: Modern C++ Standards
// - constexpr where possible, value semantics
//
// Constitution Principle IX: Layered DSP Architecture
// - Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <cstdint>
#include <limits>
#include <random>

namespace Harmonia {
namespace DSP {

// ==============================================================================
// Xorshift64 PRNG
// ==============================================================================

/// 64-bit xorshift generator (Marsaglia, shifts 13, 7, 17).
///
/// Satisfies the UniformRandomBitGenerator requirements, so it can drive the
/// standard distributions (std::normal_distribution in NoiseSource). The
/// whole state is one word, which makes reseeding from a test trivial.
///
/// @note NOT cryptographically secure
///
/// @example
///     Xorshift64 rng(12345);
///     std::normal_distribution<double> dist(0.0, 1.0);
///     double x = dist(rng);
///
class Xorshift64 {
public:
    using result_type = uint64_t;

    /// Construct with seed value.
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift64(uint64_t seedValue = kDefaultSeed) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    [[nodiscard]] static constexpr result_type min() noexcept { return 0; }
    [[nodiscard]] static constexpr result_type max() noexcept {
        return std::numeric_limits<result_type>::max();
    }

    /// Generate next 64-bit value.
    /// @return Random value in range [1, 2^64-1]
    [[nodiscard]] constexpr uint64_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 7;
        state_ ^= state_ << 17;
        return state_;
    }

    constexpr result_type operator()() noexcept { return next(); }

    /// Reseed the generator.
    /// @param seedValue New seed (0 is automatically replaced with default)
    constexpr void seed(uint64_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    /// Get current state (for debugging/serialization).
    [[nodiscard]] constexpr uint64_t state() const noexcept {
        return state_;
    }

    /// Seed used when 0 is passed (0 would make the generator emit only zeros)
    static constexpr uint64_t kDefaultSeed = 88172645463325252ull;

private:
    uint64_t state_;
};

/// @brief Draw a fresh 64-bit seed from the platform entropy source.
[[nodiscard]] inline uint64_t makeEntropySeed() {
    std::random_device device;
    const uint64_t high = static_cast<uint64_t>(device()) << 32;
    const uint64_t low = static_cast<uint64_t>(device());
    return high ^ low;
}

} // namespace DSP
} // namespace Harmonia
