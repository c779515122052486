/**
 * @file Particle.cpp
 * @brief Particle kinematics and the two-flavor vacuum oscillation with a hard matter clamp.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Particle.h"

#include <cmath>
#include <stdexcept>
#include <string>

/** @copydoc Particle::Particle */
Particle::Particle(uint64_t id, const Vector2D& position, const Vector2D& velocity, double energyMeV)
    : pid(id), pos(position), vel(velocity), energy(energyMeV) {}

/** @copydoc Particle::oscillationPhase */
double Particle::oscillationPhase(double pathLength, double energyMeV) {
    return (PhaseCoefficient * AtmosphericMassSplitting * pathLength * ScaleFactor) / energyMeV;
}

/** @copydoc Particle::advance */
void Particle::advance(double dt, bool inMatter) {
    if (!(dt > 0.0)) {
        throw std::invalid_argument("Particle::advance: dt must be > 0 (got " + std::to_string(dt) + ")");
    }
    pos = pos + vel * dt;
    path += vel.magnitude() * dt;

    // Two-flavor vacuum oscillation between electron and muon; tau stays empty.
    double arg = oscillationPhase(path, energy);
    double c = std::cos(arg);
    double s = std::sin(arg);
    flavor[Electron] = c * c;
    flavor[Muon] = s * s;
    flavor[Tau] = 0.0;

    // MSW trapping, applied as a clamp for this tick only.
    if (inMatter) {
        flavor[Electron] = 1.0;
        flavor[Muon] = 0.0;
    }
}
