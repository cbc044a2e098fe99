/**
 * @file ParticlePool.h
 * @brief Fixed-capacity arena of particle records addressed by index.
 *
 * Slots are never allocated or freed after construction. The prefix [0, activeCount) is simulated;
 * the remaining slots are parked far from the scene with zero velocity.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Vec3.h"

#include <cstddef>
#include <vector>

/** @brief One particle slot. */
struct Particle {
    Vec3 position;       /**< relative to the cell centre, scene units */
    Vec3 velocity;       /**< random-walk state */
    bool outside{true};  /**< last known side of the membrane; authoritative for transition tests */
};

/**
 * @class ParticlePool
 * @brief Owns every particle record for one simulation instance.
 */
class ParticlePool {
public:
    static constexpr size_t MaxParticles = 1400;
    static constexpr size_t MinActiveParticles = 450;
    /** @brief Radial distance at which inactive slots are parked. */
    static constexpr float ParkDistance = 1.0e4f;

    explicit ParticlePool(size_t capacity = MaxParticles);

    size_t capacity() const { return slots.size(); }
    size_t activeCount() const { return active; }
    /** @brief Set the active prefix length; clamped to capacity(). */
    void setActiveCount(size_t n);

    Particle& operator[](size_t i) { return slots[i]; }
    const Particle& operator[](size_t i) const { return slots[i]; }

    /** @brief Move slot @p i far from the scene, zero its velocity and mark it outside. */
    void park(size_t i);

    /** @brief Count active particles flagged inside / outside. */
    void countSides(size_t& inside, size_t& outside) const;

    /** @brief Number of active particles whose side flag disagrees with |position| >= @p radius. */
    size_t countSideMismatches(float radius) const;

private:
    std::vector<Particle> slots;
    size_t active{0};
};
