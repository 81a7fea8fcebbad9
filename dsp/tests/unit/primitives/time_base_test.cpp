// ==============================================================================
// Unit Tests: TimeBase
// ==============================================================================
// Layer 1: DSP Primitive Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <harmonia/dsp/core/sample_sequence.h>
#include <harmonia/dsp/primitives/time_base.h>

#include <cmath>

using Catch::Approx;
using namespace Harmonia::DSP;

TEST_CASE("Default time base spans [0, 10] with 1000 instants", "[time_base]") {
    const SampleSequence t = TimeBase::generate();

    REQUIRE(t.size() == 1000);
    CHECK(t.front() == 0.0);
    CHECK(t.back() == 10.0);
    CHECK(TimeBase::spacing(0.0, 10.0, 1000) == Approx(10.0 / 999.0));
}

TEST_CASE("Time base spacing is uniform", "[time_base]") {
    const SampleSequence t = TimeBase::generate(0.0, 10.0, 1000);
    const double step = 10.0 / 999.0;

    for (size_t i = 1; i < t.size(); ++i) {
        REQUIRE(t[i] - t[i - 1] == Approx(step).epsilon(1e-9));
    }
    REQUIRE(isStrictlyIncreasing(t));
}

TEST_CASE("Time base matches start + i * step", "[time_base]") {
    const SampleSequence t = TimeBase::generate(-2.0, 3.0, 11);

    REQUIRE(t.size() == 11);
    for (size_t i = 0; i < t.size(); ++i) {
        CHECK(t[i] == Approx(-2.0 + 0.5 * static_cast<double>(i)).margin(1e-12));
    }
}

TEST_CASE("Time base degenerate counts", "[time_base][edge]") {
    SECTION("count 0 gives an empty grid") {
        CHECK(TimeBase::generate(0.0, 10.0, 0).empty());
    }

    SECTION("count 1 gives just the start") {
        const SampleSequence t = TimeBase::generate(3.0, 10.0, 1);
        REQUIRE(t.size() == 1);
        CHECK(t[0] == 3.0);
        CHECK(TimeBase::spacing(3.0, 10.0, 1) == 0.0);
    }

    SECTION("count 2 gives both endpoints") {
        const SampleSequence t = TimeBase::generate(1.0, 2.0, 2);
        REQUIRE(t.size() == 2);
        CHECK(t[0] == 1.0);
        CHECK(t[1] == 2.0);
    }
}

TEST_CASE("Time base is deterministic", "[time_base]") {
    REQUIRE(TimeBase::generate(0.0, 7.5, 333) == TimeBase::generate(0.0, 7.5, 333));
}
