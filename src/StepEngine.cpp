/**
 * @file StepEngine.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "StepEngine.h"
#include "CrossingDetector.h"
#include "Membrane.h"
#include "ParticlePool.h"
#include "RandomSource.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr float DistEps = 1e-6f;
}

StepEngine::StepEngine(RandomSource& rng_) : rng(rng_) {}

int StepEngine::substepCount(float delta) {
    if (!(delta > 0.0f) || !std::isfinite(delta)) return 0;
    float ratio = delta / MaxSubstep;
    if (ratio >= static_cast<float>(MaxSubsteps)) return MaxSubsteps;
    int n = static_cast<int>(std::ceil(ratio));
    return n < 1 ? 1 : n;
}

StepStats StepEngine::step(ParticlePool& pool, const MotionFactors& f, float delta, CrossingDetector& detector) {
    StepStats stats;
    if (!(delta > 0.0f) || !std::isfinite(delta)) return stats;

    // Shared by every particle this step.
    const float damping = std::pow(Damping, delta);
    const float pEnter = Membrane::crossingProbability(f.kEnter, delta);
    const float pExit = Membrane::crossingProbability(f.kExit, delta);

    const size_t n = pool.activeCount();
    for (size_t i = 0; i < n; ++i) {
        advanceParticle(pool[i], f, delta, damping, pEnter, pExit, detector, stats);
    }
    return stats;
}

void StepEngine::advanceParticle(Particle& p, const MotionFactors& f, float delta, float damping,
                                 float pEnter, float pExit, CrossingDetector& detector, StepStats& stats) {
    const float r = f.sceneRadius;
    const Vec3 prevPos = p.position;
    const float dist0 = prevPos.length();

    // Random walk: isotropic per-axis impulse, then exponential damping.
    Vec3 vel = p.velocity;
    float kick = f.accel * std::sqrt(delta);
    vel.x += rng.symmetric() * kick;
    vel.y += rng.symmetric() * kick;
    vel.z += rng.symmetric() * kick;
    vel *= damping;

    Vec3 pos = prevPos + vel * (delta * f.moveScale);
    const float dist1 = pos.length();

    CrossingDirection dir = Membrane::classify(dist0, dist1, r);
    if (dir != CrossingDirection::None) {
        ++stats.attempted;
        if (!Membrane::resolve(pos, vel, prevPos, r, dir, pEnter, pExit, rng)) ++stats.reflected;
    }

    // Containment shell; both bounds lie strictly on their own side of R.
    const float dist = pos.length();
    const float minR = r * MinRadiusFraction;
    const float maxR = r * MaxRadiusFraction;
    if (dist < minR || dist > maxR) {
        const Vec3 normal = (dist < DistEps) ? prevPos.normalized() : pos * (1.0f / dist);
        const bool inner = dist < minR;
        pos = normal * (inner ? minR : maxR);
        // Mirror a radial velocity that points into the wall.
        float vRad = vel.dot(normal);
        if (inner ? vRad < 0.0f : vRad > 0.0f) vel += normal * (-2.0f * vRad);
        ++stats.clamped;
    }

    p.position = pos;
    p.velocity = vel;

    if (detector.update(p, r)) {
        if (p.outside) ++stats.exits;
        else ++stats.enters;
    }
}
