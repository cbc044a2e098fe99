/**
 * @file RateAggregator.h
 * @brief Windowed crossing counters producing inbound/outbound rate samples.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "CrossingEventQueue.h"

#include <cstdint>

/** @brief Crossing rates over one completed sampling window, in crossings per second. */
struct RateSample {
    double inRate{0.0};
    double outRate{0.0};
};

/**
 * @class RateAggregator
 * @brief Accumulate -> emit -> reset, once per window. Estimates are at most one window stale.
 */
class RateAggregator {
public:
    static constexpr double DefaultWindow = 1.0;

    explicit RateAggregator(double windowSeconds = DefaultWindow);

    void record(CrossingEvent::Kind kind);
    /**
     * @brief Advance window time by @p delta.
     * @return true when the window closed; @p out then holds the sample and the counters are reset.
     */
    bool advance(double delta, RateSample& out);
    void reset();

    uint64_t enterCount() const { return enters; }
    uint64_t exitCount() const { return exits; }
    double elapsed() const { return elapsedS; }
    double window() const { return windowS; }

private:
    double windowS;
    double elapsedS{0.0};
    uint64_t enters{0};
    uint64_t exits{0};
};
