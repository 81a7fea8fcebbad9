#pragma once

// ==============================================================================
// Parameter Identifiers and Ranges
// ==============================================================================
// One row per user-facing parameter. The name is what the UI collaborator
// sends in a parameter-change event; the label is the slider caption.
//
// Ranges:
//   amplitude, frequency, noise_mean, noise_variance: displayed slider range
//   phase: any finite value (radians)
//   filter_window: integer taps, 1 to INT_MAX
// ==============================================================================

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace Harmonia {

enum class ParamId : uint8_t {
    Amplitude = 0,
    Frequency,
    Phase,
    NoiseMean,
    NoiseVariance,
    FilterWindow
};

inline constexpr size_t kNumParams = 6;

struct ParamRange {
    ParamId id;
    std::string_view name;      // event name, e.g. "noise_mean"
    std::string_view label;     // display label, e.g. "Noise Mean"
    double minValue;
    double maxValue;
    double defaultValue;
    bool integral;
};

inline constexpr double kUnbounded = std::numeric_limits<double>::infinity();
inline constexpr double kMaxFilterWindow = static_cast<double>(std::numeric_limits<int>::max());

inline constexpr std::array<ParamRange, kNumParams> kParamRanges{{
    {ParamId::Amplitude,     "amplitude",      "Amplitude",     0.1,         5.0,              1.0,  false},
    {ParamId::Frequency,     "frequency",      "Frequency",     0.1,         3.0,              1.0,  false},
    {ParamId::Phase,         "phase",          "Phase",         -kUnbounded, kUnbounded,       0.0,  false},
    {ParamId::NoiseMean,     "noise_mean",     "Noise Mean",    -1.0,        1.0,              0.0,  false},
    {ParamId::NoiseVariance, "noise_variance", "Noise Var",     0.0,         1.0,              0.2,  false},
    {ParamId::FilterWindow,  "filter_window",  "Filter Window", 1.0,         kMaxFilterWindow, 10.0, true},
}};

[[nodiscard]] constexpr const ParamRange& paramRange(ParamId id) noexcept {
    return kParamRanges[static_cast<size_t>(id)];
}

/// @brief Look up a parameter by event name.
[[nodiscard]] constexpr std::optional<ParamId> findParamId(std::string_view name) noexcept {
    for (const auto& range : kParamRanges) {
        if (range.name == name) {
            return range.id;
        }
    }
    return std::nullopt;
}

} // namespace Harmonia
