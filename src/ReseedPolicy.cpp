/**
 * @file ReseedPolicy.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "ReseedPolicy.h"
#include "ParticlePool.h"
#include "RandomSource.h"
#include "SimulationParameters.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr float Pi = 3.14159265358979323846f;

/** @brief Uniform direction on the unit sphere (z uniform in [-1,1], azimuth uniform). */
Vec3 randomDirection(RandomSource& rng) {
    float z = rng.symmetric();
    float phi = rng.uniform01() * 2.0f * Pi;
    float s = std::sqrt(std::max(0.0f, 1.0f - z * z));
    return {s * std::cos(phi), s * std::sin(phi), z};
}
}

size_t ReseedPolicy::activeCount(float gradient, size_t capacity, size_t minActive) {
    float g = clampFinite(gradient, 0.0f, 1.0f);
    if (minActive > capacity) minActive = capacity;
    double span = static_cast<double>(capacity - minActive);
    size_t n = minActive + static_cast<size_t>(std::floor(span * g));
    return std::min(n, capacity);
}

float ReseedPolicy::insideTargetFraction(float gradient) {
    float g = clampFinite(gradient, 0.0f, 1.0f);
    return InsideFractionMin + (InsideFractionMax - InsideFractionMin) * g;
}

size_t ReseedPolicy::insideTarget(size_t activeCount, float gradient) {
    double target = static_cast<double>(activeCount) * insideTargetFraction(gradient);
    return std::min(activeCount, static_cast<size_t>(std::llround(target)));
}

size_t ReseedPolicy::apply(ParticlePool& pool, float gradient, float radius, size_t minActive, RandomSource& rng) {
    const size_t active = activeCount(gradient, pool.capacity(), minActive);
    const size_t inside = insideTarget(active, gradient);
    pool.setActiveCount(active);

    for (size_t i = 0; i < pool.capacity(); ++i) {
        if (i >= active) {
            pool.park(i);
            continue;
        }
        Particle& p = pool[i];
        bool in = i < inside;
        float shell = in ? rng.uniform(InsideShellMin, InsideShellMax)
                         : rng.uniform(OutsideShellMin, OutsideShellMax);
        p.position = randomDirection(rng) * (radius * shell);
        p.velocity = Vec3(rng.symmetric() * InitialSpeed,
                          rng.symmetric() * InitialSpeed,
                          rng.symmetric() * InitialSpeed);
        // Derive the flag from the placed position so it agrees with |position| >= R exactly.
        p.outside = p.position.length() >= radius;
    }
    return inside;
}
