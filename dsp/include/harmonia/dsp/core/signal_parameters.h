// ==============================================================================
// Layer 0: Core Utility - Signal Parameters
// ==============================================================================
// Plain value type carrying everything one recompute needs.
// Validation lives in the app layer (ParameterStore); the DSP layer only
// re-checks what it must to stay well defined.
// ==============================================================================

#pragma once

namespace Harmonia {
namespace DSP {

struct SignalParameters {
    double amplitude = 1.0;       // displayed 0.1-5.0
    double frequency = 1.0;       // displayed 0.1-3.0 (cycles per time unit)
    double phase = 0.0;           // radians, unconstrained
    double noiseMean = 0.0;       // -1.0 to 1.0
    double noiseVariance = 0.2;   // 0.0 to 1.0
    int filterWindow = 10;        // taps, >= 1

    bool operator==(const SignalParameters&) const = default;
};

} // namespace DSP
} // namespace Harmonia
