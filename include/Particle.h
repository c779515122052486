/**
 * @file Particle.h
 * @brief Declares Particle: one beam neutrino with kinematics and a flavor-probability state.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "Vector2D.h"

/**
 * @class Particle
 * @brief A neutrino travelling in a straight line whose flavor oscillates with distance.
 *
 * Responsibilities:
 * - Integrate position with a fixed velocity
 * - Accumulate traveled path length
 * - Recompute flavor probabilities from path length and energy, clamped to electron inside matter
 *
 * Only the owning SimulationEngine mutates a Particle, through advance().
 */
class Particle {
public:
    /** @brief Flavor components in display order: electron (red), muon (green), tau (blue). */
    enum Flavor { Electron = 0, Muon = 1, Tau = 2 };
    using FlavorVector = std::array<double, 3>;

    // Oscillation tuning: visually calibrated, not physical units.
    static constexpr double AtmosphericMassSplitting = 2.51e-3; // eV^2
    static constexpr double PhaseCoefficient = 1.27;
    static constexpr double ScaleFactor = 10000.0;

    /** @brief Create a pure electron-flavor particle with zero path length. */
    Particle(uint64_t id, const Vector2D& position, const Vector2D& velocity, double energyMeV);

    /**
     * @brief Advance by @p dt seconds and recompute flavor.
     * @param inMatter whether the pre-step position lies in the dense region; forces pure electron flavor.
     * @throws std::invalid_argument if dt is not strictly positive.
     */
    void advance(double dt, bool inMatter);

    /** @brief Oscillation phase (1.27 * dm^2 * L * scale) / E for a path length and energy. */
    static double oscillationPhase(double pathLength, double energyMeV);

    uint64_t id() const { return pid; }
    const Vector2D& position() const { return pos; }
    const Vector2D& velocity() const { return vel; }
    double energyMeV() const { return energy; }
    double pathLength() const { return path; }
    const FlavorVector& flavorProbability() const { return flavor; }
    double probability(Flavor f) const { return flavor[(std::size_t)f]; }

private:
    uint64_t pid;
    Vector2D pos;
    Vector2D vel;
    double energy;
    double path{0.0};
    FlavorVector flavor{{1.0, 0.0, 0.0}};
};
