/**
 * @file RandomSource.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "RandomSource.h"

#include <cmath>

MersenneRandomSource::MersenneRandomSource() : prng(rd()) {}

MersenneRandomSource::MersenneRandomSource(uint32_t seed) : prng(seed) {}

float MersenneRandomSource::uniform01() {
    float u = dist(prng);
    // Some standard libraries can round up to the upper bound for float distributions.
    if (u >= 1.0f) u = std::nextafter(1.0f, 0.0f);
    return u;
}
