/**
 * @file Membrane.h
 * @brief Semi-permeable spherical membrane: direction-dependent permeation and specular reflection.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Vec3.h"

class RandomSource;

/** @brief Radial transition of one particle within one step. */
enum class CrossingDirection { None, Inward, Outward };

/**
 * @class Membrane
 * @brief Stateless permeability rules for a membrane sphere of radius R centred at the origin.
 *
 * Gradient shifts the balance between inward and outward permeation but both rate constants stay
 * strictly positive, so the membrane is never one-way.
 *
 * Particles live in the containment shell [ContainmentMin R, ContainmentMax R]. The outside part of
 * that shell is about sixteen times the inside part, so the rate constants carry that volume ratio:
 * at steady state inside/outside = (V_in / V_out) * (kEnter / kExit), which puts the inside fraction
 * at equilibriumInsideFraction(gradient).
 */
class Membrane {
public:
    /** @brief Fraction of R a rejected particle is pushed back to (1 -/+ ReflectOffset). */
    static constexpr float ReflectOffset = 0.02f;
    /** @brief Inner and outer containment radii as fractions of R. */
    static constexpr float ContainmentMin = 0.15f;
    static constexpr float ContainmentMax = 2.6f;
    /** @brief Steady-state inside fraction at gradient 0 and 1. */
    static constexpr float EquilibriumFractionMin = 0.1f;
    static constexpr float EquilibriumFractionMax = 0.9f;

    /** @brief Steady-state share of the active particles inside, strictly increasing in @p gradient. */
    static float equilibriumInsideFraction(float gradient);

    /** @brief Volume inside R over volume outside R, both within the containment shell. */
    static float insideOutsideVolumeRatio();

    /**
     * @brief kEnter/kExit for @p gradient in [0,1] at the given temperature speed factor.
     *
     * kEnter rises and kExit falls with gradient, and kEnter/kExit = odds(equilibrium) / volume ratio.
     */
    static void rateConstants(float gradient, float speedFactor, float& kEnter, float& kExit);

    /** @brief Probability of at least one permeation event in @p delta seconds: 1 - exp(-k*delta). */
    static float crossingProbability(float k, float delta);

    /** @brief Classify the move from radial distance @p dist0 to @p dist1 against radius @p r. */
    static CrossingDirection classify(float dist0, float dist1, float r);

    /**
     * @brief Put a rejected particle back on the side it came from and mirror its radial velocity.
     * @param prevPos position before the step, used for the normal when @p pos sits at the centre.
     */
    static void reflect(Vec3& pos, Vec3& vel, const Vec3& prevPos, float r, CrossingDirection dir);

    /**
     * @brief Accept or reject a detected crossing with one uniform draw from @p rng.
     * @return true if the particle passes through; false if it was reflected.
     */
    static bool resolve(Vec3& pos, Vec3& vel, const Vec3& prevPos, float r, CrossingDirection dir,
                        float pEnter, float pExit, RandomSource& rng);
};
