/**
 * @file DiffusionModel.h
 * @brief Closed-form relative diffusion rate (Fick's law intuition, unit-light) for the status read-out.
 *
 * Independent of the particle simulation: its membrane bias constants are tuned for visual effect and
 * are not derived from this formula.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

struct DiffusionInputs {
    float radiusUm{12.0f};
    float deltaC{0.6f};
    float temperatureC{25.0f};
};

struct DiffusionOutputs {
    double surfaceArea{0.0};       /**< um^2 */
    double volume{0.0};            /**< um^3 */
    double saToV{0.0};             /**< 1/um */
    double temperatureFactor{1.0}; /**< doubles every 10 C above 25 C */
    double rawRate{0.0};
    double relativeRate{0.0};      /**< 1.0 at radius 12 um, deltaC 0.6, 25 C */
};

/** @brief Evaluate the model; inputs are clamped to CoreLimits first. */
DiffusionOutputs computeDiffusionRate(const DiffusionInputs& in);
