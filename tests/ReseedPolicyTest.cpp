/**
 * @file ReseedPolicyTest.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <catch2/catch.hpp>

#include "ParticlePool.h"
#include "RandomSource.h"
#include "ReseedPolicy.h"
#include "SequenceRandomSource.h"

#include <cmath>

TEST_CASE("active population interpolates between minimum and capacity", "[reseed]") {
    const size_t cap = ParticlePool::MaxParticles;
    const size_t minA = ParticlePool::MinActiveParticles;
    CHECK(ReseedPolicy::activeCount(0.0f, cap, minA) == 450);
    CHECK(ReseedPolicy::activeCount(1.0f, cap, minA) == 1400);
    CHECK(ReseedPolicy::activeCount(0.5f, cap, minA) == 925);
    CHECK(ReseedPolicy::activeCount(0.6f, cap, minA) == 1020);
    CHECK(ReseedPolicy::activeCount(-3.0f, cap, minA) == 450);
    CHECK(ReseedPolicy::activeCount(7.0f, cap, minA) == 1400);
}

TEST_CASE("inside target fraction is strictly increasing and never empties a side", "[reseed]") {
    float prev = -1.0f;
    for (int k = 0; k <= 100; ++k) {
        float g = k / 100.0f;
        float f = ReseedPolicy::insideTargetFraction(g);
        CHECK(f > 0.0f);
        CHECK(f < 1.0f);
        CHECK(f > prev);
        prev = f;
    }
    CHECK(ReseedPolicy::insideTargetFraction(0.1f) < ReseedPolicy::insideTargetFraction(0.9f));
}

TEST_CASE("reseed places exactly the target number inside", "[reseed]") {
    for (float g : {0.0f, 0.1f, 0.33f, 0.6f, 0.9f, 1.0f}) {
        ParticlePool pool;
        MersenneRandomSource rng(99);
        const float radius = 1.0f;
        size_t inside = ReseedPolicy::apply(pool, g, radius, ParticlePool::MinActiveParticles, rng);

        size_t active = ReseedPolicy::activeCount(g, pool.capacity(), ParticlePool::MinActiveParticles);
        size_t expected = (size_t)std::llround(active * ReseedPolicy::insideTargetFraction(g));
        CHECK(pool.activeCount() == active);
        CHECK(inside == expected);

        size_t in = 0, out = 0;
        pool.countSides(in, out);
        CHECK(in == expected);
        CHECK(out == active - expected);
        CHECK(pool.countSideMismatches(radius) == 0);

        for (size_t i = 0; i < active; ++i) {
            float d = pool[i].position.length();
            if (pool[i].outside) {
                CHECK(d >= radius * ReseedPolicy::OutsideShellMin * 0.999f);
                CHECK(d <= radius * ReseedPolicy::OutsideShellMax * 1.001f);
            } else {
                CHECK(d >= radius * ReseedPolicy::InsideShellMin * 0.999f);
                CHECK(d <= radius * ReseedPolicy::InsideShellMax * 1.001f);
            }
        }
        for (size_t i = active; i < pool.capacity(); ++i) {
            CHECK(pool[i].outside);
            CHECK(pool[i].velocity == Vec3());
            CHECK(pool[i].position.length() == Approx(ParticlePool::ParkDistance));
        }
    }
}

TEST_CASE("repeated reseeds give the same counts regardless of draws", "[reseed]") {
    ParticlePool pool;
    MersenneRandomSource a(1);
    SequenceRandomSource b({0.0f, 0.99f, 0.5f, 0.25f});
    size_t first = ReseedPolicy::apply(pool, 0.42f, 1.5f, ParticlePool::MinActiveParticles, a);
    size_t second = ReseedPolicy::apply(pool, 0.42f, 1.5f, ParticlePool::MinActiveParticles, b);
    CHECK(first == second);
    CHECK(pool.countSideMismatches(1.5f) == 0);
}

TEST_CASE("shrinking the population parks the tail", "[reseed]") {
    ParticlePool pool;
    MersenneRandomSource rng(5);
    ReseedPolicy::apply(pool, 1.0f, 1.0f, ParticlePool::MinActiveParticles, rng);
    REQUIRE(pool.activeCount() == 1400);
    ReseedPolicy::apply(pool, 0.0f, 1.0f, ParticlePool::MinActiveParticles, rng);
    REQUIRE(pool.activeCount() == 450);
    CHECK(pool[1000].outside);
    CHECK(pool[1000].velocity == Vec3());
}
