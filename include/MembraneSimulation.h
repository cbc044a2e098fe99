/**
 * @file MembraneSimulation.h
 * @brief Core facade: owns the particle pool and its collaborators, exposes configure/reseed/step and
 *        the sampled occupancy and rate outputs.
 *
 * The simulation is single-threaded and externally clocked. The host calls configure(), reseed() and
 * step() serially; nothing here spawns threads or reads a clock.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "CrossingDetector.h"
#include "CrossingEventQueue.h"
#include "ParticlePool.h"
#include "RandomSource.h"
#include "RateAggregator.h"
#include "SimulationParameters.h"
#include "StepEngine.h"

#include <cstddef>
#include <functional>
#include <memory>

/** @brief Active particles on each side of the membrane. */
struct OccupancySample {
    size_t insideCount{0};
    size_t outsideCount{0};
};

/**
 * @class MembraneSimulation
 * @brief One cell, one pool, one aggregator. Not copyable.
 */
class MembraneSimulation {
public:
    using OccupancyCallback = std::function<void(const OccupancySample&)>;
    using RateCallback = std::function<void(const RateSample&)>;

    /** @brief Construct with a Mersenne source seeded from std::random_device. */
    explicit MembraneSimulation(const SimulationParameters& params = SimulationParameters{});
    /** @brief Construct with an injected random source (e.g. a fixed sequence in tests). */
    MembraneSimulation(const SimulationParameters& params, std::unique_ptr<RandomSource> rng);

    MembraneSimulation(const MembraneSimulation&) = delete;
    MembraneSimulation& operator=(const MembraneSimulation&) = delete;

    /**
     * @brief Clamp @p params into CoreLimits and apply them.
     *
     * A radius or gradient change reseeds the pool; a temperature change only affects later steps.
     * @return the parameters actually applied.
     */
    SimulationParameters configure(const SimulationParameters& params);

    /** @brief Redistribute the pool for the current gradient/radius and restart the sampling window. */
    void reseed();

    /**
     * @brief Advance one frame by @p delta seconds, split into substeps of at most StepEngine::MaxSubstep.
     *
     * Zero, negative or non-finite delta is a no-op.
     */
    StepStats step(float delta);

    // Output callbacks, invoked once per closed sampling window.
    void setOccupancyCallback(OccupancyCallback cb) { onOccupancy = std::move(cb); }
    void setRateCallback(RateCallback cb) { onRate = std::move(cb); }

    // Read-only state
    const SimulationParameters& parameters() const { return params; }
    const MotionFactors& motionFactors() const { return factors; }
    float sceneRadius() const { return factors.sceneRadius; }
    size_t activeCount() const { return pool.activeCount(); }
    size_t capacity() const { return pool.capacity(); }
    const Particle& particle(size_t i) const { return pool[i]; }
    const ParticlePool& particles() const { return pool; }
    const CrossingEventQueue& crossingEvents() const { return events; }
    const RateAggregator& rateAggregator() const { return rates; }
    /** @brief Occupancy of the current state (not only at window boundaries). */
    OccupancySample occupancy() const;
    const RateSample& lastRateSample() const { return lastRate; }
    const OccupancySample& lastOccupancySample() const { return lastOccupancy; }
    /** @brief Completed sampling windows since the last reseed. */
    size_t sampleCount() const { return samples; }
    /** @brief Total simulated time since construction. */
    double simulatedSeconds() const { return simTime; }
    /** @brief Active particles whose side flag disagrees with their position; 0 when consistent. */
    size_t countSideMismatches() const { return pool.countSideMismatches(factors.sceneRadius); }

    /** @brief Inward/outward permeation probabilities for one integration step of @p delta seconds. */
    float enterProbability(float delta) const;
    float exitProbability(float delta) const;

private:
    void publishSample(const RateSample& rate);

    SimulationParameters params;
    MotionFactors factors;
    std::unique_ptr<RandomSource> rng;
    ParticlePool pool;
    CrossingEventQueue events;
    RateAggregator rates;
    CrossingDetector detector;
    StepEngine engine;

    OccupancyCallback onOccupancy;
    RateCallback onRate;
    RateSample lastRate;
    OccupancySample lastOccupancy;
    size_t samples{0};
    double simTime{0.0};
};
