/**
 * @file SimulationParameters.h
 * @brief Parameter snapshot {radius, gradient, temperature}, per-layer clamp limits and derived motion factors.
 *
 * Two clamp layers coexist and are kept separate: the core/analytic layer accepts the wide physical
 * ranges, the control layer mirrors the front-end sliders.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <string>

/** @brief Externally owned parameter snapshot; read-only to the core within a step. */
struct SimulationParameters {
    float radiusUm{12.0f};
    float gradient{0.6f};
    float temperatureC{25.0f};
};

/** @brief Inclusive clamp ranges for one parameter layer. */
struct ParameterLimits {
    float radiusMin, radiusMax;
    float gradientMin, gradientMax;
    float temperatureMin, temperatureMax;
};

/** @brief Core simulation and analytic model ranges: radius [1,200] um, gradient [0,1], temperature [-10,80] C. */
extern const ParameterLimits CoreLimits;
/** @brief Front-end slider ranges: radius [4,30] um, gradient [0,1], temperature [0,60] C. */
extern const ParameterLimits ControlLimits;

/** @brief Clamp @p v into [lo,hi]; NaN maps to @p lo, infinities to the matching bound. */
float clampFinite(float v, float lo, float hi);

/** @brief Clamp every field of @p p into @p limits. */
SimulationParameters clampParameters(const SimulationParameters& p, const ParameterLimits& limits);

bool sameParameters(const SimulationParameters& a, const SimulationParameters& b);

std::string describeParameters(const SimulationParameters& p);

/**
 * @struct MotionFactors
 * @brief Quantities derived once per configuration and shared by every particle in a step.
 */
struct MotionFactors {
    float sceneRadius{1.0f};  /**< membrane radius in scene units */
    float speedFactor{1.0f};  /**< temperature multiplier in [0.6,2.4] */
    float radiusFactor{1.0f}; /**< inverse scene radius; larger cells move particles relatively slower */
    float accel{0.0f};        /**< random impulse amplitude per sqrt(second) */
    float moveScale{0.0f};    /**< displacement scale applied at integration */
    float kEnter{0.0f};       /**< inward permeation rate constant (1/s) */
    float kExit{0.0f};        /**< outward permeation rate constant (1/s) */
};

/** @brief Scene radius for a cell of @p radiusUm; 12 um maps to 1 scene unit, clamped to [0.35,2.2]. */
float sceneRadiusForUm(float radiusUm);

/** @brief Speed multiplier rising linearly with temperature over [0,60] C, range [0.6,2.4]. */
float speedFactorForTemperature(float temperatureC);

/** @brief Derive all motion factors from an already clamped parameter snapshot. */
MotionFactors deriveMotionFactors(const SimulationParameters& p);
