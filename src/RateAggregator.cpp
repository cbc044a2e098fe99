/**
 * @file RateAggregator.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "RateAggregator.h"

#include <algorithm>

namespace {
constexpr double ElapsedEps = 1e-6;
}

RateAggregator::RateAggregator(double windowSeconds)
    : windowS(std::max(ElapsedEps, windowSeconds)) {}

void RateAggregator::record(CrossingEvent::Kind kind) {
    if (kind == CrossingEvent::Kind::Enter) ++enters;
    else ++exits;
}

bool RateAggregator::advance(double delta, RateSample& out) {
    if (!(delta > 0.0)) return false;
    elapsedS += delta;
    if (elapsedS < windowS) return false;
    double span = std::max(ElapsedEps, elapsedS);
    out.inRate = static_cast<double>(enters) / span;
    out.outRate = static_cast<double>(exits) / span;
    reset();
    return true;
}

void RateAggregator::reset() {
    elapsedS = 0.0;
    enters = 0;
    exits = 0;
}
