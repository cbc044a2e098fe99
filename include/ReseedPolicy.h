/**
 * @file ReseedPolicy.h
 * @brief Sizes the active population from the gradient and redistributes it between inside and outside.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>

class ParticlePool;
class RandomSource;

/**
 * @class ReseedPolicy
 * @brief Deterministic target counts for a gradient; only the placement of particles is random.
 *
 * The starting inside fraction lies between an even split and Membrane::equilibriumInsideFraction,
 * so after a reseed the net flux runs inward for gradients above 0.5 and outward below.
 */
class ReseedPolicy {
public:
    static constexpr float InsideFractionMin = 0.35f; /**< target inside fraction at gradient 0 */
    static constexpr float InsideFractionMax = 0.65f; /**< target inside fraction at gradient 1 */
    static constexpr float InsideShellMin = 0.15f;    /**< inside placement radius range, fraction of R */
    static constexpr float InsideShellMax = 0.95f;
    static constexpr float OutsideShellMin = 1.1f;    /**< outside placement radius range, fraction of R */
    static constexpr float OutsideShellMax = 2.6f;
    static constexpr float InitialSpeed = 0.02f;      /**< per-axis bound of the initial jitter velocity */

    /** @brief floor(lerp(minActive, capacity, gradient)). */
    static size_t activeCount(float gradient, size_t capacity, size_t minActive);
    /** @brief Strictly increasing in gradient, always within [InsideFractionMin, InsideFractionMax]. */
    static float insideTargetFraction(float gradient);
    /** @brief round(activeCount * insideTargetFraction(gradient)). */
    static size_t insideTarget(size_t activeCount, float gradient);

    /**
     * @brief Rewrite every slot of @p pool for @p gradient and scene radius @p radius.
     * @return the number of active particles placed inside.
     */
    static size_t apply(ParticlePool& pool, float gradient, float radius, size_t minActive, RandomSource& rng);
};
