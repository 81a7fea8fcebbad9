// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Double-precision constants shared by the signal pipeline.
// Components import these instead of defining pi locally.
//
// Constitution Compliance:
// - Principle III: Modern C++ (constexpr, inline)
// - Principle IX: Layer 0 (no dependencies on other DSP layers)
// ==============================================================================

#pragma once

namespace Harmonia {
namespace DSP {

/// Pi, full double precision
inline constexpr double kPi = 3.14159265358979323846;

/// Two times Pi (angular frequency: omega = kTwoPi * f)
inline constexpr double kTwoPi = 2.0 * kPi;

} // namespace DSP
} // namespace Harmonia
