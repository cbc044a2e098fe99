/**
 * @file StepEngine.h
 * @brief Advances every active particle once per frame: random walk, damping, integration,
 *        membrane permeation and radial containment.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Membrane.h"
#include "SimulationParameters.h"

#include <cstddef>

struct Particle;
class ParticlePool;
class CrossingDetector;
class RandomSource;

/** @brief Per-step bookkeeping, useful for logging and tests. */
struct StepStats {
    size_t attempted{0}; /**< radial moves that crossed R before permeation was resolved */
    size_t reflected{0}; /**< attempted crossings rejected by the membrane */
    size_t enters{0};    /**< genuine outside -> inside transitions */
    size_t exits{0};     /**< genuine inside -> outside transitions */
    size_t clamped{0};   /**< particles rescaled into [MinRadiusFraction, MaxRadiusFraction] * R */

    StepStats& operator+=(const StepStats& o) {
        attempted += o.attempted;
        reflected += o.reflected;
        enters += o.enters;
        exits += o.exits;
        clamped += o.clamped;
        return *this;
    }
};

/**
 * @class StepEngine
 * @brief Synchronous per-frame integrator. Owns no clock: the caller supplies delta.
 */
class StepEngine {
public:
    static constexpr float Damping = 0.78f; /**< velocity retained per second */
    static constexpr float MinRadiusFraction = Membrane::ContainmentMin; /**< inner containment radius / R */
    static constexpr float MaxRadiusFraction = Membrane::ContainmentMax; /**< outer containment radius / R */
    /** @brief Longest single integration step; longer frames are split. */
    static constexpr float MaxSubstep = 1.0f / 60.0f;
    static constexpr int MaxSubsteps = 6000;

    explicit StepEngine(RandomSource& rng);

    /**
     * @brief Number of equal substeps, each no longer than MaxSubstep, covering @p delta.
     *
     * 0 for a non-positive or non-finite delta; capped at MaxSubsteps.
     */
    static int substepCount(float delta);

    /**
     * @brief Advance pool[0, activeCount) by one integration step of @p delta seconds.
     *
     * The random impulse scales with sqrt(delta) so the walk does not depend on how a frame is split.
     * A non-positive or non-finite delta leaves the pool untouched and draws no random numbers.
     */
    StepStats step(ParticlePool& pool, const MotionFactors& f, float delta, CrossingDetector& detector);

private:
    void advanceParticle(Particle& p, const MotionFactors& f, float delta, float damping,
                         float pEnter, float pExit, CrossingDetector& detector, StepStats& stats);

    RandomSource& rng;
};
