// ==============================================================================
// ParameterStore Implementation
// ==============================================================================

#include "parameters/parameter_store.h"

#include "logging/log.h"

#include <harmonia/dsp/primitives/moving_average_filter.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace Harmonia {

namespace {

constexpr std::string_view kLogTag = "params";

void assign(DSP::SignalParameters& params, ParamId id, double value) noexcept {
    switch (id) {
        case ParamId::Amplitude:     params.amplitude = value; break;
        case ParamId::Frequency:     params.frequency = value; break;
        case ParamId::Phase:         params.phase = value; break;
        case ParamId::NoiseMean:     params.noiseMean = value; break;
        case ParamId::NoiseVariance: params.noiseVariance = value; break;
        case ParamId::FilterWindow:  params.filterWindow = static_cast<int>(value); break;
    }
}

} // anonymous namespace

std::string_view toString(RangePolicy policy) noexcept {
    switch (policy) {
        case RangePolicy::Reject: return "reject";
        case RangePolicy::Clamp:  return "clamp";
    }
    return "?";
}

DSP::SignalParameters ParameterStore::defaults() noexcept {
    DSP::SignalParameters params;
    for (const auto& range : kParamRanges) {
        assign(params, range.id, range.defaultValue);
    }
    return params;
}

DSP::Status ParameterStore::validate(ParamId id, double value, RangePolicy policy,
                                     double& accepted) noexcept {
    if (!std::isfinite(value)) {
        return DSP::Status::InvalidParameter;
    }

    const ParamRange& range = paramRange(id);
    double candidate = value;

    if (policy == RangePolicy::Clamp) {
        if (range.integral) {
            candidate = std::round(candidate);
        }
        candidate = std::clamp(candidate, range.minValue, range.maxValue);
    }

    // Same window rule the filter applies
    if (id == ParamId::FilterWindow) {
        int window = 0;
        if (const DSP::Status status =
                DSP::MovingAverageFilter::windowFromValue(candidate, window);
            status != DSP::Status::Ok) {
            return status;
        }
    } else if (candidate < range.minValue || candidate > range.maxValue) {
        return DSP::Status::InvalidParameter;
    }

    accepted = candidate;
    return DSP::Status::Ok;
}

DSP::Status ParameterStore::set(std::string_view name, double value) {
    const auto id = findParamId(name);
    if (!id) {
        Log::debug(kLogTag, "unknown parameter '" + std::string(name) + "'");
        return DSP::Status::InvalidParameter;
    }
    return set(*id, value);
}

DSP::Status ParameterStore::set(ParamId id, double value) {
    double accepted = 0.0;
    const DSP::Status status = validate(id, value, policy_, accepted);
    const ParamRange& range = paramRange(id);

    if (status != DSP::Status::Ok) {
        Log::debug(kLogTag, std::string(range.name) + " rejected " + std::to_string(value));
        return status;
    }

    if (accepted != value) {
        Log::debug(kLogTag, std::string(range.name) + " clamped " + std::to_string(value) +
                                " -> " + std::to_string(accepted));
    }

    assign(params_, id, accepted);
    return DSP::Status::Ok;
}

const DSP::SignalParameters& ParameterStore::reset() noexcept {
    params_ = defaults();
    return params_;
}

double ParameterStore::value(ParamId id) const noexcept {
    switch (id) {
        case ParamId::Amplitude:     return params_.amplitude;
        case ParamId::Frequency:     return params_.frequency;
        case ParamId::Phase:         return params_.phase;
        case ParamId::NoiseMean:     return params_.noiseMean;
        case ParamId::NoiseVariance: return params_.noiseVariance;
        case ParamId::FilterWindow:  return static_cast<double>(params_.filterWindow);
    }
    return 0.0;
}

} // namespace Harmonia
