/**
 * @file DiffusionModel.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "DiffusionModel.h"
#include "SimulationParameters.h"

#include <cmath>

namespace {
constexpr double Pi = 3.14159265358979323846;
constexpr double MembraneThicknessUm = 0.01;

double surfaceToVolume(double r) {
    double sa = 4.0 * Pi * r * r;
    double v = (4.0 / 3.0) * Pi * r * r * r;
    return sa / v;
}

double baselineRate() {
    const DiffusionInputs base;
    return (surfaceToVolume(base.radiusUm) / MembraneThicknessUm) * base.deltaC;
}
}

DiffusionOutputs computeDiffusionRate(const DiffusionInputs& in) {
    SimulationParameters p = clampParameters({in.radiusUm, in.deltaC, in.temperatureC}, CoreLimits);
    const double r = p.radiusUm;

    DiffusionOutputs out;
    out.surfaceArea = 4.0 * Pi * r * r;
    out.volume = (4.0 / 3.0) * Pi * r * r * r;
    out.saToV = out.surfaceArea / out.volume;
    // Q10-style heuristic: rate doubles per 10 C.
    out.temperatureFactor = std::pow(2.0, (p.temperatureC - 25.0) / 10.0);
    out.rawRate = (out.saToV / MembraneThicknessUm) * p.gradient * out.temperatureFactor;
    out.relativeRate = out.rawRate / baselineRate();
    return out;
}
