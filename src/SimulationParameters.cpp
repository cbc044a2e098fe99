/**
 * @file SimulationParameters.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SimulationParameters.h"
#include "Membrane.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

const ParameterLimits CoreLimits{1.0f, 200.0f, 0.0f, 1.0f, -10.0f, 80.0f};
const ParameterLimits ControlLimits{4.0f, 30.0f, 0.0f, 1.0f, 0.0f, 60.0f};

namespace {
constexpr float ReferenceRadiusUm = 12.0f;
constexpr float SceneRadiusMin = 0.35f;
constexpr float SceneRadiusMax = 2.2f;
constexpr float TemperatureSpanC = 60.0f;
constexpr float SpeedFactorMin = 0.6f;
constexpr float SpeedFactorSpan = 1.8f;
constexpr float BaseAccel = 1.4f;
constexpr float BaseMoveScale = 1.25f;
constexpr float RadiusEps = 1e-6f;
}

float clampFinite(float v, float lo, float hi) {
    if (std::isnan(v)) return lo;
    return std::max(lo, std::min(hi, v));
}

SimulationParameters clampParameters(const SimulationParameters& p, const ParameterLimits& limits) {
    SimulationParameters out;
    out.radiusUm = clampFinite(p.radiusUm, limits.radiusMin, limits.radiusMax);
    out.gradient = clampFinite(p.gradient, limits.gradientMin, limits.gradientMax);
    out.temperatureC = clampFinite(p.temperatureC, limits.temperatureMin, limits.temperatureMax);
    return out;
}

bool sameParameters(const SimulationParameters& a, const SimulationParameters& b) {
    return a.radiusUm == b.radiusUm && a.gradient == b.gradient && a.temperatureC == b.temperatureC;
}

std::string describeParameters(const SimulationParameters& p) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "radius=%.1fum gradient=%.2f temperature=%.1fC",
                  p.radiusUm, p.gradient, p.temperatureC);
    return buf;
}

float sceneRadiusForUm(float radiusUm) {
    return clampFinite(radiusUm / ReferenceRadiusUm, SceneRadiusMin, SceneRadiusMax);
}

float speedFactorForTemperature(float temperatureC) {
    float tempNorm = clampFinite(temperatureC / TemperatureSpanC, 0.0f, 1.0f);
    return SpeedFactorMin + tempNorm * SpeedFactorSpan;
}

MotionFactors deriveMotionFactors(const SimulationParameters& p) {
    MotionFactors f;
    f.sceneRadius = sceneRadiusForUm(p.radiusUm);
    f.speedFactor = speedFactorForTemperature(p.temperatureC);
    f.radiusFactor = 1.0f / std::max(RadiusEps, f.sceneRadius);
    f.accel = BaseAccel * f.speedFactor * f.radiusFactor;
    f.moveScale = BaseMoveScale * f.speedFactor * f.radiusFactor;
    Membrane::rateConstants(p.gradient, f.speedFactor, f.kEnter, f.kExit);
    return f;
}
