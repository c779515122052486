#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "Particle.h"

namespace {
Particle makeParticle(double energy = 500.0, double angle = 0.0) {
    Vector2D v = Vector2D(std::cos(angle), std::sin(angle)) * 200.0;
    return Particle(7, Vector2D(10.0, 300.0), v, energy);
}
}

TEST(ParticleTest, StartsAsPureElectron) {
    Particle p = makeParticle();
    EXPECT_EQ(p.id(), 7u);
    EXPECT_DOUBLE_EQ(p.pathLength(), 0.0);
    EXPECT_DOUBLE_EQ(p.probability(Particle::Electron), 1.0);
    EXPECT_DOUBLE_EQ(p.probability(Particle::Muon), 0.0);
    EXPECT_DOUBLE_EQ(p.probability(Particle::Tau), 0.0);
}

TEST(ParticleTest, AdvanceDisplacesByVelocityTimesDt) {
    Particle p = makeParticle(500.0, 0.07);
    Vector2D before = p.position();
    Vector2D v = p.velocity();
    p.advance(0.016, false);
    EXPECT_DOUBLE_EQ(p.position().x, before.x + v.x * 0.016);
    EXPECT_DOUBLE_EQ(p.position().y, before.y + v.y * 0.016);
    EXPECT_DOUBLE_EQ(p.pathLength(), v.magnitude() * 0.016);
}

TEST(ParticleTest, PathLengthStrictlyIncreases) {
    Particle p = makeParticle(480.0, -0.04);
    double last = p.pathLength();
    for (double dt : {0.016, 1e-6, 0.5, 0.016, 3.0}) {
        p.advance(dt, false);
        EXPECT_GT(p.pathLength(), last);
        last = p.pathLength();
    }
}

TEST(ParticleTest, ProbabilitiesStayNormalized) {
    Particle p = makeParticle(350.0, 0.02);
    for (int i = 0; i < 500; ++i) {
        p.advance(0.016, (i / 50) % 2 == 1);
        const auto& f = p.flavorProbability();
        EXPECT_NEAR(f[0] + f[1], 1.0, 1e-12);
        EXPECT_DOUBLE_EQ(f[2], 0.0);
        for (double c : f) {
            EXPECT_GE(c, 0.0);
            EXPECT_LE(c, 1.0);
        }
    }
}

TEST(ParticleTest, QuarterPhaseIsPureMuon) {
    // L such that 1.27 * 2.51e-3 * L * 1e4 / 500 == pi/2
    const double pi = std::acos(-1.0);
    double L = (pi / 2.0) * 500.0 / (1.27 * 2.51e-3 * 10000.0);
    Particle p = makeParticle(500.0, 0.0);
    p.advance(L / 200.0, false);
    EXPECT_NEAR(Particle::oscillationPhase(p.pathLength(), 500.0), pi / 2.0, 1e-12);
    EXPECT_NEAR(p.probability(Particle::Electron), 0.0, 1e-12);
    EXPECT_NEAR(p.probability(Particle::Muon), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(p.probability(Particle::Tau), 0.0);
}

TEST(ParticleTest, HigherEnergyOscillatesSlower) {
    double L = 20.0;
    EXPECT_GT(Particle::oscillationPhase(L, 500.0), Particle::oscillationPhase(L, 5000.0));
    EXPECT_DOUBLE_EQ(Particle::oscillationPhase(0.0, 500.0), 0.0);
}

TEST(ParticleTest, MatterClampsThenOscillationResumes) {
    Particle p = makeParticle(500.0, 0.0);
    p.advance(0.016, false);
    p.advance(0.016, false);
    EXPECT_LT(p.probability(Particle::Electron), 1.0);

    p.advance(0.016, true);
    EXPECT_DOUBLE_EQ(p.probability(Particle::Electron), 1.0);
    EXPECT_DOUBLE_EQ(p.probability(Particle::Muon), 0.0);
    EXPECT_DOUBLE_EQ(p.probability(Particle::Tau), 0.0);

    // Leaving matter continues from the accumulated path, not from zero
    p.advance(0.016, false);
    double arg = Particle::oscillationPhase(p.pathLength(), 500.0);
    EXPECT_NEAR(p.pathLength(), 4 * 200.0 * 0.016, 1e-9);
    EXPECT_NEAR(p.probability(Particle::Electron), std::cos(arg) * std::cos(arg), 1e-12);
    EXPECT_NEAR(p.probability(Particle::Muon), std::sin(arg) * std::sin(arg), 1e-12);
}

TEST(ParticleTest, NonPositiveDtThrows) {
    Particle p = makeParticle();
    EXPECT_THROW(p.advance(0.0, false), std::invalid_argument);
    EXPECT_THROW(p.advance(-0.1, false), std::invalid_argument);
    EXPECT_DOUBLE_EQ(p.pathLength(), 0.0);
}
