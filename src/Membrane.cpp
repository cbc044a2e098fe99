/**
 * @file Membrane.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Membrane.h"
#include "RandomSource.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr float RateBase = 4.4f;
constexpr float DistEps = 1e-6f;
}

float Membrane::equilibriumInsideFraction(float gradient) {
    float g = std::max(0.0f, std::min(1.0f, gradient));
    return EquilibriumFractionMin + (EquilibriumFractionMax - EquilibriumFractionMin) * g;
}

float Membrane::insideOutsideVolumeRatio() {
    const float inner = ContainmentMin * ContainmentMin * ContainmentMin;
    const float outer = ContainmentMax * ContainmentMax * ContainmentMax;
    return (1.0f - inner) / (outer - 1.0f);
}

void Membrane::rateConstants(float gradient, float speedFactor, float& kEnter, float& kExit) {
    float f = equilibriumInsideFraction(gradient);
    float odds = f / (1.0f - f);
    // Split the required ratio evenly between the two directions.
    float bias = std::sqrt(odds / insideOutsideVolumeRatio());
    float kBase = RateBase * speedFactor;
    kEnter = kBase * bias;
    kExit = kBase / bias;
}

float Membrane::crossingProbability(float k, float delta) {
    if (!(k > 0.0f) || !(delta > 0.0f)) return 0.0f;
    return 1.0f - std::exp(-k * delta);
}

CrossingDirection Membrane::classify(float dist0, float dist1, float r) {
    if (dist0 < r && dist1 >= r) return CrossingDirection::Outward;
    if (dist0 >= r && dist1 < r) return CrossingDirection::Inward;
    return CrossingDirection::None;
}

void Membrane::reflect(Vec3& pos, Vec3& vel, const Vec3& prevPos, float r, CrossingDirection dir) {
    if (dir == CrossingDirection::None) return;
    Vec3 normal = (pos.length() >= DistEps) ? pos.normalized() : prevPos.normalized();
    // Came from outside -> stay just outside; came from inside -> stay just inside.
    float target = (dir == CrossingDirection::Inward) ? r * (1.0f + ReflectOffset)
                                                      : r * (1.0f - ReflectOffset);
    pos = normal * target;
    float vRad = vel.dot(normal);
    vel += normal * (-2.0f * vRad);
}

bool Membrane::resolve(Vec3& pos, Vec3& vel, const Vec3& prevPos, float r, CrossingDirection dir,
                       float pEnter, float pExit, RandomSource& rng) {
    if (dir == CrossingDirection::None) return true;
    float p = (dir == CrossingDirection::Inward) ? pEnter : pExit;
    if (rng.uniform01() < p) return true;
    reflect(pos, vel, prevPos, r, dir);
    return false;
}
