/**
 * @file MembraneSimulation.cpp
 * @brief Core facade implementation: parameter application, reseeding, stepping and sampling.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "MembraneSimulation.h"
#include "Logger.h"
#include "Membrane.h"
#include "ReseedPolicy.h"

#include <cmath>
#include <cstdio>

namespace {
std::unique_ptr<RandomSource> orDefaultSource(std::unique_ptr<RandomSource> rng) {
    if (rng) return rng;
    return std::make_unique<MersenneRandomSource>();
}
}

/** @copydoc MembraneSimulation::MembraneSimulation(const SimulationParameters&) */
MembraneSimulation::MembraneSimulation(const SimulationParameters& p)
    : MembraneSimulation(p, nullptr) {}

MembraneSimulation::MembraneSimulation(const SimulationParameters& p, std::unique_ptr<RandomSource> source)
    : params(clampParameters(p, CoreLimits)),
      factors(deriveMotionFactors(params)),
      rng(orDefaultSource(std::move(source))),
      pool(ParticlePool::MaxParticles),
      detector(rates, events),
      engine(*rng) {
    reseed();
}

/** @copydoc MembraneSimulation::configure */
SimulationParameters MembraneSimulation::configure(const SimulationParameters& p) {
    SimulationParameters next = clampParameters(p, CoreLimits);
    if (sameParameters(next, params)) return params;

    bool needsReseed = next.radiusUm != params.radiusUm || next.gradient != params.gradient;
    params = next;
    factors = deriveMotionFactors(params);
    Logger::info("configure: " + describeParameters(params));
    if (needsReseed) reseed();
    return params;
}

/** @copydoc MembraneSimulation::reseed */
void MembraneSimulation::reseed() {
    size_t inside = ReseedPolicy::apply(pool, params.gradient, factors.sceneRadius,
                                        ParticlePool::MinActiveParticles, *rng);
    events.clear();
    rates.reset();
    samples = 0;
    lastRate = RateSample{};
    lastOccupancy = occupancy();
    Logger::info("reseed: active=" + std::to_string(pool.activeCount()) +
                 " inside=" + std::to_string(inside) +
                 " outside=" + std::to_string(pool.activeCount() - inside));
}

/** @copydoc MembraneSimulation::step */
StepStats MembraneSimulation::step(float delta) {
    StepStats stats;
    const int substeps = StepEngine::substepCount(delta);
    if (substeps == 0) return stats;

    // Bursts age and the sampling window advances once per substep.
    const float dts = delta / static_cast<float>(substeps);
    for (int s = 0; s < substeps; ++s) {
        stats += engine.step(pool, factors, dts, detector);
        simTime += dts;
        events.age(dts);

        RateSample sample;
        if (rates.advance(dts, sample)) publishSample(sample);
    }

#ifndef NDEBUG
    size_t bad = countSideMismatches();
    if (bad > 0) Logger::error("side flag desynchronized for " + std::to_string(bad) + " particle(s)");
#endif
    return stats;
}

OccupancySample MembraneSimulation::occupancy() const {
    OccupancySample o;
    pool.countSides(o.insideCount, o.outsideCount);
    return o;
}

float MembraneSimulation::enterProbability(float delta) const {
    return Membrane::crossingProbability(factors.kEnter, delta);
}

float MembraneSimulation::exitProbability(float delta) const {
    return Membrane::crossingProbability(factors.kExit, delta);
}

void MembraneSimulation::publishSample(const RateSample& rate) {
    lastRate = rate;
    lastOccupancy = occupancy();
    ++samples;
    if (Logger::enabled(Logger::Level::Debug)) {
        char buf[160];
        std::snprintf(buf, sizeof(buf), "sample %zu: inside=%zu outside=%zu in=%.2f/s out=%.2f/s",
                      samples, lastOccupancy.insideCount, lastOccupancy.outsideCount,
                      rate.inRate, rate.outRate);
        Logger::debug(buf);
    }
    if (onOccupancy) onOccupancy(lastOccupancy);
    if (onRate) onRate(rate);
}
