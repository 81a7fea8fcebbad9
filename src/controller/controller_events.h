#pragma once

// ==============================================================================
// Controller Events
// ==============================================================================
// Messages the UI collaborator sends into ReactiveController, and the
// visibility notice it gets back. Plain values; no UI framework types.
// ==============================================================================

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace Harmonia {

// ==============================================================================
// Series
// ==============================================================================

enum class Series : uint8_t {
    Pure = 0,
    Noisy,
    Filtered
};

inline constexpr size_t kNumSeries = 3;

inline constexpr std::array<std::string_view, kNumSeries> kSeriesNames{
    "pure", "noisy", "filtered"
};

[[nodiscard]] constexpr std::string_view seriesName(Series series) noexcept {
    return kSeriesNames[static_cast<size_t>(series)];
}

[[nodiscard]] constexpr std::optional<Series> findSeries(std::string_view name) noexcept {
    for (size_t i = 0; i < kNumSeries; ++i) {
        if (kSeriesNames[i] == name) {
            return static_cast<Series>(i);
        }
    }
    return std::nullopt;
}

// ==============================================================================
// Inbound events
// ==============================================================================

struct ParameterChangeEvent {
    std::string name;   // e.g. "frequency"
    double value = 0.0;
};

struct ResetEvent {};

struct VisibilityToggleEvent {
    std::string series; // "pure", "noisy" or "filtered"
};

using ControllerEvent = std::variant<ParameterChangeEvent, ResetEvent, VisibilityToggleEvent>;

// ==============================================================================
// Outbound visibility notice
// ==============================================================================

struct VisibilityChange {
    Series series = Series::Pure;
    bool visible = true;

    [[nodiscard]] std::string_view seriesName() const noexcept {
        return Harmonia::seriesName(series);
    }
};

} // namespace Harmonia
