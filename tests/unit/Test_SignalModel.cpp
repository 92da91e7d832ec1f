#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <SignalModel/SignalModel.hpp>

#include <stdexcept>

using Catch::Approx;
using namespace footfall::signal;

TEST_CASE("SignalModel distance reference points", "[SignalModel]")
{
    REQUIRE(rssiToDistance(-60.0) == Approx(2.0));
    REQUIRE(rssiToDistance(-80.0) == Approx(10.0));
    REQUIRE(rssiToDistance(-70.0) == Approx(6.0));

    // clamped outside the reference range
    REQUIRE(rssiToDistance(-20.0) == Approx(2.0));
    REQUIRE(rssiToDistance(-120.0) == Approx(10.0));
}

TEST_CASE("SignalModel distance is monotone and bounded", "[SignalModel]")
{
    double previous = rssiToDistance(-30.0);
    for (double rssi = -30.5; rssi >= -110.0; rssi -= 0.5)
    {
        const double d = rssiToDistance(rssi);
        REQUIRE(d >= previous);
        REQUIRE(d >= 2.0);
        REQUIRE(d <= 10.0);
        previous = d;
    }
}

TEST_CASE("SignalModel weight is positive, bounded and non-decreasing", "[SignalModel]")
{
    REQUIRE(rssiToWeight(-40.0) == Approx(10.0));
    REQUIRE(rssiToWeight(-100.0) == Approx(1.0 / 1.1));

    double previous = rssiToWeight(-130.0);
    for (double rssi = -129.0; rssi <= 0.0; rssi += 1.0)
    {
        const double w = rssiToWeight(rssi);
        REQUIRE(w > 0.0);
        REQUIRE(w <= 10.0);
        REQUIRE(w >= previous);
        previous = w;
    }
}

TEST_CASE("SignalModel rejects inconsistent calibration", "[SignalModel]")
{
    SECTION("inverted distance reference points")
    {
        SignalModelConfig cfg;
        cfg.nearRssi = -90.0;
        REQUIRE_THROWS_AS(SignalModel(cfg), std::invalid_argument);
    }

    SECTION("non-positive weight offset")
    {
        SignalModelConfig cfg;
        cfg.weightOffset = 0.0;
        REQUIRE_THROWS_AS(SignalModel(cfg), std::invalid_argument);
    }

    SECTION("custom calibration is honored")
    {
        SignalModelConfig cfg;
        cfg.nearDistance = 1.0;
        cfg.farDistance = 5.0;
        SignalModel model(cfg);
        REQUIRE(model.distance(-70.0) == Approx(3.0));
    }
}
