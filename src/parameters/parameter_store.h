#pragma once

// ==============================================================================
// ParameterStore - Current Signal Parameters
// ==============================================================================
// Sole owner of the live SignalParameters. Every change goes through set(),
// reset() or restore(); nothing else holds a mutable reference.
//
// Out-of-range handling is fixed at construction:
//   Reject - the value fails with InvalidParameter, the store is unchanged
//   Clamp  - the value is clamped into range (filter_window is also rounded)
// Non-finite values and unknown names fail under both policies.
// ==============================================================================

#include "parameters/parameter_ids.h"

#include <harmonia/dsp/core/signal_parameters.h>
#include <harmonia/dsp/core/status.h>

#include <cstdint>
#include <string_view>

namespace Harmonia {

enum class RangePolicy : uint8_t {
    Reject = 0,
    Clamp
};

[[nodiscard]] std::string_view toString(RangePolicy policy) noexcept;

class ParameterStore {
public:
    explicit ParameterStore(RangePolicy policy = RangePolicy::Reject) noexcept
        : policy_(policy) {}

    /// @brief Current values.
    [[nodiscard]] const DSP::SignalParameters& get() const noexcept { return params_; }

    /// @brief Set one parameter by event name.
    /// @return InvalidParameter for an unknown name or a value the policy refuses
    [[nodiscard]] DSP::Status set(std::string_view name, double value);

    /// @brief Set one parameter by id.
    [[nodiscard]] DSP::Status set(ParamId id, double value);

    /// @brief Restore the startup defaults.
    const DSP::SignalParameters& reset() noexcept;

    /// @brief Roll back to an earlier get() snapshot.
    void restore(const DSP::SignalParameters& snapshot) noexcept { params_ = snapshot; }

    /// @brief Current value of one parameter as a real number.
    [[nodiscard]] double value(ParamId id) const noexcept;

    [[nodiscard]] RangePolicy rangePolicy() const noexcept { return policy_; }

    /// @brief Startup defaults (amplitude 1, frequency 1, phase 0,
    ///        noise mean 0, noise variance 0.2, filter window 10).
    [[nodiscard]] static DSP::SignalParameters defaults() noexcept;

    /// @brief Apply the range policy to a candidate value.
    /// @param id Parameter being set
    /// @param value Requested value
    /// @param policy Reject or Clamp
    /// @param accepted Receives the value to store on success
    [[nodiscard]] static DSP::Status validate(ParamId id, double value, RangePolicy policy,
                                              double& accepted) noexcept;

private:
    RangePolicy policy_;
    DSP::SignalParameters params_ = defaults();
};

} // namespace Harmonia
