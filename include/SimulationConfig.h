/**
 * @file SimulationConfig.h
 * @brief Declares SimulationConfig (engine tunables) and RunOptions (front-end options), plus their
 *        environment and command-line loaders.
 *
 * Layering: compiled defaults, then FLAVORSIM_* environment variables, then command-line options.
 * Unparseable values are ignored; out-of-range values are reset to defaults by sanitize().
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @struct SimulationConfig
 * @brief Every constant the engine uses. Defaults reproduce the reference beam exactly.
 */
struct SimulationConfig {
    // Population and emission
    size_t maxPopulation = 150;
    uint64_t emissionInterval = 5;     // ticks between emissions
    double emitterX = 10.0;
    double emitterYMin = 250.0;
    double emitterYMax = 350.0;
    double angularHalfWidth = 0.1;     // radians around +x
    double particleSpeed = 200.0;      // domain units per second
    double energySpreadFraction = 0.05;
    double beamEnergyMeV = 500.0;

    // Integration and domain
    double dt = 0.016;
    double exitX = 850.0;
    double domainWidth = 800.0;
    double domainHeight = 600.0;
    double matterStartX = 400.0;
    double matterWidth = 100.0;
    int markerSize = 6;

    // Scheduling
    int tickPeriodMs = 16;
    int idlePollMs = 100;

    // 0 seeds from std::random_device
    uint64_t seed = 0;
    // Drop a particle whose update throws instead of terminating the run loop
    bool isolateParticleFailures = false;

    /** @brief Reset invalid fields to their defaults. Returns the names of fields that were reset. */
    std::vector<std::string> sanitize();
    /** @brief Apply FLAVORSIM_* environment overrides. */
    void applyEnvironment();
};

/**
 * @struct RunOptions
 * @brief Options for the flavorsim executable that are not engine tunables.
 */
struct RunOptions {
    bool headless = false;
    uint64_t ticks = 600;   // headless: snapshots to consume before exiting
    std::string outPath;    // headless: empty writes to stdout
    bool showHelp = false;
};

/**
 * @brief Apply command-line overrides to @p cfg and @p opts.
 *
 * Accepts "--opt value" and "--opt=value" for every valued option. Unknown arguments are returned in
 * @p unknown so the caller can report them.
 */
void applyArguments(int argc, char** argv, SimulationConfig& cfg, RunOptions& opts, std::vector<std::string>& unknown);

/** @brief Strict decimal parse of a whole C string; false on empty, trailing junk, overflow or non-finite. */
bool parseDouble(const char* s, double& out);
/** @brief Strict unsigned integer parse of a whole C string. */
bool parseUnsigned(const char* s, uint64_t& out);

/** @brief Usage text for the flavorsim executable. */
std::string usageText(const char* argv0);
