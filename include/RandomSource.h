/**
 * @file RandomSource.h
 * @brief Injectable uniform random source consumed by the step engine and reseed policy.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <random>

/**
 * @class RandomSource
 * @brief Abstract uniform source. Production code uses MersenneRandomSource; tests may replay fixed sequences.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /** @brief Uniform real in [0,1). */
    virtual float uniform01() = 0;

    /** @brief Uniform real in [-1,1). */
    float symmetric() { return uniform01() * 2.0f - 1.0f; }
    /** @brief Uniform real in [lo,hi). */
    float uniform(float lo, float hi) { return lo + (hi - lo) * uniform01(); }
};

/**
 * @class MersenneRandomSource
 * @brief mt19937-backed source, seeded from std::random_device unless an explicit seed is given.
 */
class MersenneRandomSource : public RandomSource {
public:
    MersenneRandomSource();
    explicit MersenneRandomSource(uint32_t seed);

    float uniform01() override;

private:
    std::random_device rd;
    std::mt19937 prng;
    std::uniform_real_distribution<float> dist{0.0f, 1.0f};
};
