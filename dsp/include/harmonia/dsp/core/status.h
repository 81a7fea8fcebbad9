// ==============================================================================
// Layer 0: Core Utility - Status Codes
// ==============================================================================
// Result codes returned by every fallible operation in Harmonia.
// Nothing in the library throws; callers check the returned Status.
// ==============================================================================

#pragma once

#include <cstdint>
#include <string_view>

namespace Harmonia {
namespace DSP {

/// @brief Outcome of a pipeline, parameter or controller operation.
enum class Status : uint8_t {
    Ok = 0,            ///< Operation completed
    InvalidParameter,  ///< Out-of-range, non-finite or unknown value; state unchanged
    Busy               ///< Event refused because a recompute is in progress
};

[[nodiscard]] constexpr bool isOk(Status status) noexcept {
    return status == Status::Ok;
}

/// @brief Stable text form for logs and console output.
[[nodiscard]] constexpr std::string_view toString(Status status) noexcept {
    switch (status) {
        case Status::Ok:               return "Ok";
        case Status::InvalidParameter: return "InvalidParameter";
        case Status::Busy:             return "Busy";
    }
    return "Unknown";
}

} // namespace DSP
} // namespace Harmonia
