/**
 * @file CrossingDetector.h
 * @brief Compares a particle's final side against its stored side flag and emits crossing events.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "CrossingEventQueue.h"

struct Particle;
class RateAggregator;

/**
 * @class CrossingDetector
 * @brief Runs exactly once per active particle per step, after the particle's position is final.
 *
 * A reflected crossing leaves the particle on its original side and therefore never reaches the
 * event sinks; only genuine side changes are counted.
 */
class CrossingDetector {
public:
    CrossingDetector(RateAggregator& rates, CrossingEventQueue& events);

    /**
     * @brief Update @p p's side flag against a membrane of radius @p radius.
     * @return true if the particle changed side (an event was emitted).
     */
    bool update(Particle& p, float radius);

    /** @brief Build the event for a particle now on the given side, snapped onto the membrane. */
    static CrossingEvent makeEvent(const Particle& p, float radius, bool nowOutside);

private:
    RateAggregator& rates;
    CrossingEventQueue& events;
};
