/**
 * @file SimulationEngine.h
 * @brief Declares SimulationEngine: owns the neutrino beam, runs the fixed-timestep tick and publishes snapshots.
 *
 * The engine is the only writer of particle state. It talks to the outside world exclusively through a
 * ControlChannel (inbound commands) and a FrameChannel (outbound snapshots).
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

#include "ControlChannel.h"
#include "DensityField.h"
#include "FrameChannel.h"
#include "Particle.h"
#include "SimulationConfig.h"

/**
 * @class SimulationEngine
 * @brief Two-state (Stopped/Running) beam simulation.
 *
 * Each call to step() drains the control inbox and, if Running, performs exactly one tick:
 * emit, advance (matter lookup at the pre-step position), cull, assemble snapshot, publish, tick++.
 * startThread() runs step() on a background thread at the configured period.
 *
 * Accessors that expose particle state (particles(), tick(), counters) must only be used from the
 * engine thread or while no background thread is running.
 */
class SimulationEngine {
public:
    /** @brief Build an engine from a sanitized copy of @p cfg; each reset field is logged at warn level. */
    SimulationEngine(const SimulationConfig& cfg, ControlChannel& control, FrameChannel& frames);
    ~SimulationEngine();

    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    // Background loop
    /** @brief Start the fixed-rate loop thread. No-op if already started. */
    void startThread();
    /** @brief Ask the loop to exit after the current tick and join it. Safe to call repeatedly. */
    void stopThread();
    /** @brief Whether the loop thread is active (false after stopThread() or a fatal error). */
    bool isLooping() const { return looping.load(); }
    /** @brief True once a tick has thrown; the loop has terminated and will not publish again. */
    bool failed() const { return hasFailed.load(); }

    /**
     * @brief Drain pending control messages, then run one tick if Running.
     * @return true if a tick ran (and a snapshot was published).
     * @throws whatever a tick throws; startThread() converts that into a logged, terminal failure.
     */
    bool step();
    /** @brief Apply one control message immediately. Unknown commands and malformed parameters are ignored. */
    void applyControl(const ControlMessage& msg);

    // State
    bool isRunning() const { return running.load(); }
    double beamEnergyMeV() const { return beamEnergy.load(); }
    uint64_t tick() const { return tickCount; }
    const std::vector<Particle>& particles() const { return live; }
    size_t particleCount() const { return live.size(); }
    size_t maxPopulation() const { return cfg.maxPopulation; }
    const DensityField& densityField() const { return field; }
    const SimulationConfig& config() const { return cfg; }

    // Counters
    uint64_t emittedCount() const { return nextParticleId; }
    uint64_t culledCount() const { return culled; }
    uint64_t isolatedFailures() const { return isolated; }

private:
    void emitParticle();
    void advanceParticles();
    void cullParticles();
    void assembleSnapshot(Snapshot& dst) const;
    void runLoop();
    void setRunning(bool on);

    SimulationConfig cfg;
    ControlChannel& control;
    FrameChannel& frames;
    DensityField field;

    std::vector<Particle> live;
    std::vector<ControlMessage> pendingMsgs; // reused drain buffer
    uint64_t tickCount{0};
    uint64_t nextParticleId{0};
    uint64_t culled{0};
    uint64_t isolated{0};
    std::atomic<bool> running{false};
    std::atomic<double> beamEnergy;

    // Randomness
    std::mt19937_64 prng;

    // Background stepping
    std::thread loopThread;
    std::atomic<bool> threadExit{false};
    std::atomic<bool> looping{false};
    std::atomic<bool> hasFailed{false};
    std::mutex stateMtx; // for cv waits between ticks
    std::condition_variable cv;
};
