// ==============================================================================
// AppConfig Parsing Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "config/app_config.h"

#include <limits>
#include <string>
#include <string_view>
#include <vector>

using namespace Harmonia;
using Harmonia::DSP::Status;

namespace {

Status parse(std::vector<std::string_view> args, AppConfig& config, std::string& error) {
    return parseConfigArgs(args, config, error);
}

} // anonymous namespace

TEST_CASE("Default config describes the standard grid", "[config]") {
    const AppConfig config;
    std::string error;

    CHECK(config.timeStart == 0.0);
    CHECK(config.timeStop == 10.0);
    CHECK(config.sampleCount == 1000);
    CHECK_FALSE(config.seed.has_value());
    CHECK(config.rangePolicy == RangePolicy::Reject);
    CHECK(config.edgePolicy == DSP::EdgePolicy::ZeroPad);
    CHECK(config.logLevel == LogLevel::Info);
    CHECK(validateConfig(config, error) == Status::Ok);
}

TEST_CASE("Every flag is applied", "[config]") {
    AppConfig config;
    std::string error;

    REQUIRE(parse({"--seed", "42", "--samples", "500", "--start", "-2.5", "--stop", "2.5",
                   "--policy", "clamp", "--edge", "truncate", "--log-level", "debug"},
                  config, error) == Status::Ok);

    REQUIRE(config.seed.has_value());
    CHECK(*config.seed == 42);
    CHECK(config.sampleCount == 500);
    CHECK(config.timeStart == -2.5);
    CHECK(config.timeStop == 2.5);
    CHECK(config.rangePolicy == RangePolicy::Clamp);
    CHECK(config.edgePolicy == DSP::EdgePolicy::Truncate);
    CHECK(config.logLevel == LogLevel::Debug);
}

TEST_CASE("No arguments keeps the config", "[config]") {
    AppConfig config;
    config.sampleCount = 64;
    std::string error;

    REQUIRE(parse({}, config, error) == Status::Ok);
    CHECK(config.sampleCount == 64);
}

TEST_CASE("Bad arguments leave the config untouched", "[config][edge]") {
    AppConfig config;
    std::string error;

    SECTION("unknown flag") {
        CHECK(parse({"--verbose", "1"}, config, error) == Status::InvalidParameter);
        CHECK(error.find("--verbose") != std::string::npos);
    }
    SECTION("missing value") {
        CHECK(parse({"--seed"}, config, error) == Status::InvalidParameter);
        CHECK(error.find("missing") != std::string::npos);
    }
    SECTION("non-numeric seed") {
        CHECK(parse({"--seed", "abc"}, config, error) == Status::InvalidParameter);
    }
    SECTION("trailing garbage") {
        CHECK(parse({"--samples", "12x"}, config, error) == Status::InvalidParameter);
    }
    SECTION("unknown policy") {
        CHECK(parse({"--policy", "wrap"}, config, error) == Status::InvalidParameter);
    }
    SECTION("unknown edge mode") {
        CHECK(parse({"--edge", "mirror"}, config, error) == Status::InvalidParameter);
    }
    SECTION("reversed range") {
        CHECK(parse({"--samples", "100", "--start", "5", "--stop", "1"}, config, error) ==
              Status::InvalidParameter);
    }
    SECTION("too few samples") {
        CHECK(parse({"--samples", "1"}, config, error) == Status::InvalidParameter);
    }

    CHECK_FALSE(error.empty());
    CHECK(config.sampleCount == 1000);
    CHECK(config.timeStart == 0.0);
    CHECK_FALSE(config.seed.has_value());
}

TEST_CASE("validateConfig rejects unusable grids", "[config][edge]") {
    std::string error;
    AppConfig config;

    config.timeStop = config.timeStart;
    CHECK(validateConfig(config, error) == Status::InvalidParameter);

    config = AppConfig{};
    config.timeStop = std::numeric_limits<double>::infinity();
    CHECK(validateConfig(config, error) == Status::InvalidParameter);

    config = AppConfig{};
    config.sampleCount = 0;
    CHECK(validateConfig(config, error) == Status::InvalidParameter);

    SECTION("span overflows") {
        config = AppConfig{};
        config.timeStart = -1e308;
        config.timeStop = 1e308;
        CHECK(validateConfig(config, error) == Status::InvalidParameter);
        CHECK(error.find("overflow") != std::string::npos);
    }

    SECTION("step below double resolution") {
        // ulp(1e16) is 2, so a 1000-sample grid over 1000 units repeats instants
        config = AppConfig{};
        config.timeStart = 1e16;
        config.timeStop = 1e16 + 1000.0;
        CHECK_FALSE(DSP::isStrictlyIncreasing(
            DSP::TimeBase::generate(config.timeStart, config.timeStop, config.sampleCount)));
        CHECK(validateConfig(config, error) == Status::InvalidParameter);
    }

    SECTION("too many samples") {
        config = AppConfig{};
        config.sampleCount = 100'000'000;
        CHECK(validateConfig(config, error) == Status::InvalidParameter);

        config.sampleCount = kMaxSampleCount + 1;
        CHECK(validateConfig(config, error) == Status::InvalidParameter);

        config.sampleCount = kMaxSampleCount;
        CHECK(validateConfig(config, error) == Status::Ok);
    }
}

TEST_CASE("Oversized sample count is refused on the command line", "[config][edge]") {
    AppConfig config;
    std::string error;

    CHECK(parse({"--samples", "100000000"}, config, error) == Status::InvalidParameter);
    CHECK(config.sampleCount == 1000);
}

TEST_CASE("Edge policy names", "[config]") {
    CHECK(toString(DSP::EdgePolicy::ZeroPad) == "zero");
    CHECK(toString(DSP::EdgePolicy::Truncate) == "truncate");
}
