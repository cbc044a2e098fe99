/**
 * @file SimulationParametersTest.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <catch2/catch.hpp>

#include "SimulationParameters.h"

#include <cmath>
#include <limits>

namespace {
bool within(const SimulationParameters& p, const ParameterLimits& l) {
    return p.radiusUm >= l.radiusMin && p.radiusUm <= l.radiusMax &&
           p.gradient >= l.gradientMin && p.gradient <= l.gradientMax &&
           p.temperatureC >= l.temperatureMin && p.temperatureC <= l.temperatureMax;
}
}

TEST_CASE("core and control layers keep their own ranges", "[parameters]") {
    CHECK(CoreLimits.radiusMin == 1.0f);
    CHECK(CoreLimits.radiusMax == 200.0f);
    CHECK(CoreLimits.temperatureMin == -10.0f);
    CHECK(CoreLimits.temperatureMax == 80.0f);
    CHECK(ControlLimits.radiusMin == 4.0f);
    CHECK(ControlLimits.radiusMax == 30.0f);
    CHECK(ControlLimits.temperatureMin == 0.0f);
    CHECK(ControlLimits.temperatureMax == 60.0f);

    SimulationParameters wild{500.0f, 3.0f, -40.0f};
    SimulationParameters core = clampParameters(wild, CoreLimits);
    SimulationParameters control = clampParameters(wild, ControlLimits);
    CHECK(core.radiusUm == 200.0f);
    CHECK(core.gradient == 1.0f);
    CHECK(core.temperatureC == -10.0f);
    CHECK(control.radiusUm == 30.0f);
    CHECK(control.temperatureC == 0.0f);
}

TEST_CASE("clamping always lands inside the layer for any input", "[parameters]") {
    const float inf = std::numeric_limits<float>::infinity();
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float samples[] = {-inf, -1e9f, -50.0f, -1.0f, 0.0f, 0.5f, 1.0f, 12.0f, 75.0f, 1e9f, inf, nan};
    for (float r : samples) {
        for (float g : samples) {
            for (float t : samples) {
                SimulationParameters p{r, g, t};
                CHECK(within(clampParameters(p, CoreLimits), CoreLimits));
                CHECK(within(clampParameters(p, ControlLimits), ControlLimits));
            }
        }
    }
    CHECK(clampFinite(nan, 2.0f, 3.0f) == 2.0f);
    CHECK(clampFinite(inf, 2.0f, 3.0f) == 3.0f);
    CHECK(clampFinite(-inf, 2.0f, 3.0f) == 2.0f);
}

TEST_CASE("scene radius maps 12 um to one unit and saturates", "[parameters]") {
    CHECK(sceneRadiusForUm(12.0f) == Approx(1.0f));
    CHECK(sceneRadiusForUm(24.0f) == Approx(2.0f));
    CHECK(sceneRadiusForUm(1.0f) == Approx(0.35f));
    CHECK(sceneRadiusForUm(200.0f) == Approx(2.2f));
}

TEST_CASE("speed factor rises linearly with temperature within [0.6, 2.4]", "[parameters]") {
    CHECK(speedFactorForTemperature(-10.0f) == Approx(0.6f));
    CHECK(speedFactorForTemperature(0.0f) == Approx(0.6f));
    CHECK(speedFactorForTemperature(30.0f) == Approx(1.5f));
    CHECK(speedFactorForTemperature(60.0f) == Approx(2.4f));
    CHECK(speedFactorForTemperature(80.0f) == Approx(2.4f));
}

TEST_CASE("larger cells move particles relatively slower", "[parameters]") {
    MotionFactors small = deriveMotionFactors({6.0f, 0.5f, 25.0f});
    MotionFactors large = deriveMotionFactors({24.0f, 0.5f, 25.0f});
    CHECK(small.radiusFactor == Approx(2.0f));
    CHECK(large.radiusFactor == Approx(0.5f));
    CHECK(small.accel > large.accel);
    CHECK(small.moveScale > large.moveScale);

    MotionFactors cold = deriveMotionFactors({12.0f, 0.5f, 0.0f});
    MotionFactors hot = deriveMotionFactors({12.0f, 0.5f, 60.0f});
    CHECK(hot.accel == Approx(cold.accel * 4.0f));
    CHECK(hot.kEnter > cold.kEnter);
}

TEST_CASE("parameter description is human readable", "[parameters]") {
    CHECK(describeParameters({12.0f, 0.6f, 25.0f}) == "radius=12.0um gradient=0.60 temperature=25.0C");
    CHECK(sameParameters({1.0f, 0.2f, 3.0f}, {1.0f, 0.2f, 3.0f}));
    CHECK_FALSE(sameParameters({1.0f, 0.2f, 3.0f}, {1.0f, 0.3f, 3.0f}));
}
