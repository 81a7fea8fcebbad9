// ==============================================================================
// Parameter Identifier Table Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "parameters/parameter_ids.h"
#include "parameters/parameter_store.h"

#include <harmonia/dsp/core/signal_parameters.h>

#include <set>
#include <string_view>

using namespace Harmonia;

TEST_CASE("Parameter table rows are indexed by id", "[params][ids]") {
    for (size_t i = 0; i < kNumParams; ++i) {
        CHECK(static_cast<size_t>(kParamRanges[i].id) == i);
    }
}

TEST_CASE("Parameter names are unique and resolvable", "[params][ids]") {
    std::set<std::string_view> names;
    for (const auto& range : kParamRanges) {
        CHECK(names.insert(range.name).second);
        const auto id = findParamId(range.name);
        REQUIRE(id.has_value());
        CHECK(*id == range.id);
    }

    CHECK_FALSE(findParamId("Amplitude").has_value());
    CHECK_FALSE(findParamId("gain").has_value());
    CHECK_FALSE(findParamId("").has_value());
}

TEST_CASE("Table defaults agree with SignalParameters defaults", "[params][ids]") {
    CHECK(ParameterStore::defaults() == Harmonia::DSP::SignalParameters{});

    for (const auto& range : kParamRanges) {
        CHECK(range.defaultValue >= range.minValue);
        CHECK(range.defaultValue <= range.maxValue);
    }
}

TEST_CASE("Displayed slider ranges", "[params][ids]") {
    CHECK(paramRange(ParamId::Amplitude).minValue == 0.1);
    CHECK(paramRange(ParamId::Amplitude).maxValue == 5.0);
    CHECK(paramRange(ParamId::Frequency).minValue == 0.1);
    CHECK(paramRange(ParamId::Frequency).maxValue == 3.0);
    CHECK(paramRange(ParamId::NoiseMean).minValue == -1.0);
    CHECK(paramRange(ParamId::NoiseMean).maxValue == 1.0);
    CHECK(paramRange(ParamId::NoiseVariance).minValue == 0.0);
    CHECK(paramRange(ParamId::NoiseVariance).maxValue == 1.0);
    CHECK(paramRange(ParamId::FilterWindow).integral);
    CHECK(paramRange(ParamId::NoiseVariance).label == "Noise Var");
}
