/**
 * @file ParticlePool.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "ParticlePool.h"

#include <algorithm>

ParticlePool::ParticlePool(size_t capacity) : slots(capacity) {
    for (size_t i = 0; i < slots.size(); ++i) park(i);
}

void ParticlePool::setActiveCount(size_t n) {
    active = std::min(n, slots.size());
}

void ParticlePool::park(size_t i) {
    Particle& p = slots[i];
    p.position = Vec3(ParkDistance, 0.0f, 0.0f);
    p.velocity = Vec3();
    p.outside = true;
}

void ParticlePool::countSides(size_t& inside, size_t& outside) const {
    inside = 0;
    outside = 0;
    for (size_t i = 0; i < active; ++i) {
        if (slots[i].outside) ++outside;
        else ++inside;
    }
}

size_t ParticlePool::countSideMismatches(float radius) const {
    size_t bad = 0;
    for (size_t i = 0; i < active; ++i) {
        bool isOutside = slots[i].position.length() >= radius;
        if (isOutside != slots[i].outside) ++bad;
    }
    return bad;
}
