// ==============================================================================
// AppConfig Implementation
// ==============================================================================

#include "config/app_config.h"

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace Harmonia {

namespace {

template <typename T>
bool parseNumber(std::string_view text, T& out) noexcept {
    if (text.empty()) {
        return false;
    }
    T value{};
    const char* const last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return false;
    }
    out = value;
    return true;
}

bool parseRangePolicy(std::string_view text, RangePolicy& policy) noexcept {
    if (text == "reject") { policy = RangePolicy::Reject; return true; }
    if (text == "clamp")  { policy = RangePolicy::Clamp;  return true; }
    return false;
}

bool parseEdgePolicy(std::string_view text, DSP::EdgePolicy& policy) noexcept {
    if (text == "zero")     { policy = DSP::EdgePolicy::ZeroPad;  return true; }
    if (text == "truncate") { policy = DSP::EdgePolicy::Truncate; return true; }
    return false;
}

} // anonymous namespace

std::string_view toString(DSP::EdgePolicy policy) noexcept {
    switch (policy) {
        case DSP::EdgePolicy::ZeroPad:  return "zero";
        case DSP::EdgePolicy::Truncate: return "truncate";
    }
    return "?";
}

DSP::Status validateConfig(const AppConfig& config, std::string& error) {
    if (!std::isfinite(config.timeStart) || !std::isfinite(config.timeStop)) {
        error = "time range must be finite";
        return DSP::Status::InvalidParameter;
    }
    if (!(config.timeStop > config.timeStart)) {
        error = "time range stop must be greater than start";
        return DSP::Status::InvalidParameter;
    }
    if (!std::isfinite(config.timeStop - config.timeStart)) {
        error = "time range span overflows";
        return DSP::Status::InvalidParameter;
    }
    if (config.sampleCount < 2) {
        error = "time base needs at least 2 samples";
        return DSP::Status::InvalidParameter;
    }
    if (config.sampleCount > kMaxSampleCount) {
        error = "time base is limited to " + std::to_string(kMaxSampleCount) + " samples";
        return DSP::Status::InvalidParameter;
    }

    const DSP::SampleSequence grid =
        DSP::TimeBase::generate(config.timeStart, config.timeStop, config.sampleCount);
    if (!DSP::isStrictlyIncreasing(grid)) {
        error = "time step is below the double resolution of the range";
        return DSP::Status::InvalidParameter;
    }
    return DSP::Status::Ok;
}

DSP::Status parseConfigArgs(std::span<const std::string_view> args, AppConfig& config,
                            std::string& error) {
    AppConfig parsed = config;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view flag = args[i];
        if (i + 1 >= args.size()) {
            error = "missing value for " + std::string(flag);
            return DSP::Status::InvalidParameter;
        }
        const std::string_view value = args[++i];
        bool ok = false;

        if (flag == "--seed") {
            uint64_t seed = 0;
            ok = parseNumber(value, seed);
            if (ok) parsed.seed = seed;
        } else if (flag == "--samples") {
            ok = parseNumber(value, parsed.sampleCount);
        } else if (flag == "--start") {
            ok = parseNumber(value, parsed.timeStart);
        } else if (flag == "--stop") {
            ok = parseNumber(value, parsed.timeStop);
        } else if (flag == "--policy") {
            ok = parseRangePolicy(value, parsed.rangePolicy);
        } else if (flag == "--edge") {
            ok = parseEdgePolicy(value, parsed.edgePolicy);
        } else if (flag == "--log-level") {
            ok = parseLogLevel(value, parsed.logLevel);
        } else {
            error = "unknown option " + std::string(flag);
            return DSP::Status::InvalidParameter;
        }

        if (!ok) {
            error = "invalid value '" + std::string(value) + "' for " + std::string(flag);
            return DSP::Status::InvalidParameter;
        }
    }

    if (const DSP::Status status = validateConfig(parsed, error); status != DSP::Status::Ok) {
        return status;
    }

    config = parsed;
    return DSP::Status::Ok;
}

} // namespace Harmonia
