/**
 * @file Config.h
 * @brief Front-end configuration: defaults, DIFFUSION_* environment overrides, then command-line overrides.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "SimulationParameters.h"

#include <cstdint>
#include <functional>
#include <string>

struct Config {
    SimulationParameters params;  /**< initial parameters; clamped later by the simulation */
    bool seedSet{false};          /**< use @ref seed instead of std::random_device */
    uint32_t seed{0};
    bool headless{false};         /**< run without ncurses and print samples to stdout */
    float durationS{10.0f};       /**< headless run length in simulated seconds */
    float dtS{1.0f / 60.0f};      /**< headless fixed step */
};

enum class ParseOutcome { Run, Help };

/** @brief Environment accessor; returns nullptr when a variable is unset. */
using EnvLookup = std::function<const char*(const char*)>;

/** @brief Parse a finite float; @p out is untouched on failure. */
bool parseFloat(const char* s, float& out);
/** @brief Parse a non-negative integer that fits in 32 bits; @p out is untouched on failure. */
bool parseUnsigned(const char* s, uint32_t& out);

/** @brief Apply DIFFUSION_RADIUS, DIFFUSION_GRADIENT, DIFFUSION_TEMPERATURE and DIFFUSION_SEED. */
void applyEnvironment(Config& cfg, const EnvLookup& lookup);
/** @brief Apply the process environment through std::getenv. */
void applyEnvironment(Config& cfg);

/**
 * @brief Apply command-line options. Invalid values and unknown options are logged and ignored.
 * @return ParseOutcome::Help if -h/--help was given.
 */
ParseOutcome parseArguments(Config& cfg, int argc, const char* const* argv);

std::string usage(const char* prog);
