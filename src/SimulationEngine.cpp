/**
 * @file SimulationEngine.cpp
 * @brief Beam emission, per-tick propagation with the matter effect, culling and snapshot publication.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SimulationEngine.h"

#include "Logger.h"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace {
uint64_t seedFrom(uint64_t configured) {
    if (configured != 0) return configured;
    std::random_device rd;
    return ((uint64_t)rd() << 32) ^ (uint64_t)rd();
}

SimulationConfig sanitizedCopy(const SimulationConfig& config) {
    SimulationConfig c = config;
    for (const auto& f : c.sanitize()) Logger::warn("engine config " + f + " out of range; using default");
    return c;
}

bool finiteState(const Particle& p) {
    const auto& f = p.flavorProbability();
    return std::isfinite(p.position().x) && std::isfinite(p.position().y) && std::isfinite(p.pathLength())
        && std::isfinite(f[0]) && std::isfinite(f[1]) && std::isfinite(f[2]);
}
}

/** @copydoc SimulationEngine::SimulationEngine */
SimulationEngine::SimulationEngine(const SimulationConfig& config, ControlChannel& controlIn, FrameChannel& framesOut)
    : cfg(sanitizedCopy(config)), control(controlIn), frames(framesOut),
      field(cfg.matterStartX, cfg.matterWidth),
      beamEnergy(cfg.beamEnergyMeV), prng(seedFrom(cfg.seed)) {
    live.reserve(cfg.maxPopulation);
}

/** @copydoc SimulationEngine::~SimulationEngine */
SimulationEngine::~SimulationEngine() {
    stopThread();
}

void SimulationEngine::startThread() {
    if (loopThread.joinable()) return;
    threadExit.store(false);
    looping.store(true);
    loopThread = std::thread(&SimulationEngine::runLoop, this);
}

void SimulationEngine::stopThread() {
    if (!loopThread.joinable()) return;
    {
        std::lock_guard<std::mutex> lk(stateMtx);
        threadExit.store(true);
    }
    cv.notify_all();
    loopThread.join();
}

/** @brief Fixed-rate loop: tick then sleep while Running, poll at the idle period while Stopped. */
void SimulationEngine::runLoop() {
    Logger::info("engine thread starting");
    try {
        while (!threadExit.load()) {
            bool ticked = step();
            int waitMs = ticked ? cfg.tickPeriodMs : cfg.idlePollMs;
            std::unique_lock<std::mutex> lk(stateMtx);
            cv.wait_for(lk, std::chrono::milliseconds(waitMs), [this]{ return threadExit.load(); });
        }
    } catch (const std::exception& e) {
        Logger::logException("engine tick " + std::to_string(tickCount) + " failed; simulation terminated", e);
        hasFailed.store(true);
    } catch (...) {
        Logger::logUnknownException("engine tick " + std::to_string(tickCount) + " failed; simulation terminated");
        hasFailed.store(true);
    }
    running.store(false);
    looping.store(false);
    Logger::info("engine thread exiting at tick " + std::to_string(tickCount));
}

bool SimulationEngine::step() {
    pendingMsgs.clear();
    control.drain(pendingMsgs);
    for (const auto& m : pendingMsgs) applyControl(m);

    if (!running.load()) return false;

    if (live.size() < cfg.maxPopulation && tickCount % cfg.emissionInterval == 0) emitParticle();
    advanceParticles();
    cullParticles();

    Snapshot& dst = frames.backBuffer();
    assembleSnapshot(dst);
    frames.publish();

    ++tickCount;
    return true;
}

void SimulationEngine::applyControl(const ControlMessage& msg) {
    if (!msg.command.empty()) {
        if (msg.command == ControlMessage::Start) setRunning(true);
        else if (msg.command == ControlMessage::Stop) setRunning(false);
        else Logger::warn("ignoring unknown command '" + msg.command + "'");
    }
    for (const auto& kv : msg.params) {
        if (kv.first != ControlMessage::BeamEnergy) {
            Logger::debug("ignoring unknown parameter '" + kv.first + "'");
            continue;
        }
        double e = kv.second;
        if (!(e > 0.0) || !std::isfinite(e)) {
            Logger::warn("ignoring malformed beam_energy " + std::to_string(e));
            continue;
        }
        double prev = beamEnergy.exchange(e);
        if (prev != e) Logger::info("beam energy set(MeV): " + std::to_string(e));
    }
}

void SimulationEngine::setRunning(bool on) {
    bool prev = running.exchange(on);
    if (prev != on) Logger::info(std::string("running = ") + (on ? "true" : "false") + " at tick " + std::to_string(tickCount));
}

void SimulationEngine::emitParticle() {
    double beam = beamEnergy.load();
    double y = cfg.emitterYMin;
    if (cfg.emitterYMax > cfg.emitterYMin) {
        std::uniform_real_distribution<double> yDist(cfg.emitterYMin, cfg.emitterYMax);
        y = yDist(prng);
    }
    double angle = 0.0;
    if (cfg.angularHalfWidth > 0.0) {
        std::uniform_real_distribution<double> aDist(-cfg.angularHalfWidth, cfg.angularHalfWidth);
        angle = aDist(prng);
    }
    double energy = beam;
    if (cfg.energySpreadFraction > 0.0) {
        std::normal_distribution<double> eDist(beam, beam * cfg.energySpreadFraction);
        energy = eDist(prng);
        // A non-positive draw would make the oscillation phase undefined
        if (!(energy > 0.0)) energy = beam;
    }
    Vector2D velocity = Vector2D(std::cos(angle), std::sin(angle)) * cfg.particleSpeed;
    uint64_t id = nextParticleId++;
    live.emplace_back(id, Vector2D(cfg.emitterX, y), velocity, energy);
    if (Logger::enabled(Logger::Level::Debug)) {
        Logger::debug("emit id=" + std::to_string(id) + " tick=" + std::to_string(tickCount)
                      + " E=" + std::to_string(energy) + " y=" + std::to_string(y));
    }
}

void SimulationEngine::advanceParticles() {
    for (size_t i = 0; i < live.size();) {
        Particle& p = live[i];
        try {
            // Matter is sampled before the move
            bool inMatter = field.isDense(p.position());
            p.advance(cfg.dt, inMatter);
            if (!finiteState(p)) {
                throw std::runtime_error("particle " + std::to_string(p.id()) + " produced a non-finite state");
            }
        } catch (const std::exception& e) {
            if (!cfg.isolateParticleFailures) throw;
            Logger::warn("dropping particle " + std::to_string(p.id()) + " at tick " + std::to_string(tickCount) + ": " + e.what());
            live.erase(live.begin() + (std::ptrdiff_t)i);
            ++isolated;
            continue;
        }
        ++i;
    }
}

void SimulationEngine::cullParticles() {
    size_t out = 0;
    for (size_t i = 0; i < live.size(); ++i) {
        if (live[i].position().x > cfg.exitX) { ++culled; continue; }
        if (out != i) live[out] = std::move(live[i]);
        ++out;
    }
    live.erase(live.begin() + (std::ptrdiff_t)out, live.end());
}

void SimulationEngine::assembleSnapshot(Snapshot& dst) const {
    dst.clear();
    dst.reserve(live.size());
    dst.tick = tickCount;
    for (const auto& p : live) {
        dst.x.push_back(p.position().x);
        dst.y.push_back(p.position().y);
        dst.color.push_back(flavorColorHex(p.flavorProbability()));
        dst.size.push_back(cfg.markerSize);
    }
    dst.metrics.count = live.size();
    dst.metrics.avgEnergy = beamEnergy.load();
}
