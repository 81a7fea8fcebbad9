#pragma once

// ==============================================================================
// AppConfig - Startup Configuration
// ==============================================================================
// Everything fixed for the lifetime of a ReactiveController: the time grid,
// the noise seed, and the range / edge / log policies.
//
// Command-line flags understood by parseConfigArgs():
//   --seed N                 fixed noise seed (default: entropy)
//   --samples N              time-base length (default 1000, max kMaxSampleCount)
//   --start X  --stop X      time-base range (default 0 to 10)
//   --policy reject|clamp    out-of-range parameter handling
//   --edge zero|truncate     moving-average edge policy
//   --log-level debug|info|warn|error|off
// ==============================================================================

#include "logging/log.h"
#include "parameters/parameter_store.h"

#include <harmonia/dsp/core/status.h>
#include <harmonia/dsp/primitives/moving_average_filter.h>
#include <harmonia/dsp/primitives/time_base.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace Harmonia {

/// Largest accepted time base (8 MB per series).
inline constexpr size_t kMaxSampleCount = 1'000'000;

struct AppConfig {
    double timeStart = DSP::TimeBase::kDefaultStart;
    double timeStop = DSP::TimeBase::kDefaultStop;
    size_t sampleCount = DSP::TimeBase::kDefaultCount;
    std::optional<uint64_t> seed;                            // nullopt = entropy
    RangePolicy rangePolicy = RangePolicy::Reject;
    DSP::EdgePolicy edgePolicy = DSP::EdgePolicy::ZeroPad;
    LogLevel logLevel = LogLevel::Info;
};

/// @brief Check that the time grid is usable: finite range and span, stop > start,
///        2 to kMaxSampleCount samples, strictly increasing instants.
/// @param error Receives a description on failure
[[nodiscard]] DSP::Status validateConfig(const AppConfig& config, std::string& error);

/// @brief Fill `config` from command-line arguments (program name excluded).
/// @param args Arguments, e.g. {"--seed", "42", "--edge", "truncate"}
/// @param config Updated in place; fields without a flag keep their value
/// @param error Receives a description on failure
/// @return InvalidParameter for an unknown flag, a missing value, a bad value,
///         or a resulting config that fails validateConfig()
[[nodiscard]] DSP::Status parseConfigArgs(std::span<const std::string_view> args,
                                          AppConfig& config, std::string& error);

[[nodiscard]] std::string_view toString(DSP::EdgePolicy policy) noexcept;

} // namespace Harmonia
