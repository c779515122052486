/**
 * @file SimulationConfig.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SimulationConfig.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

bool parseDouble(const char* s, double& out) {
    if (!s || !*s || std::isspace((unsigned char)*s)) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || errno != 0 || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parseUnsigned(const char* s, uint64_t& out) {
    // strtoull would skip whitespace and wrap a negative sign
    if (!s || !*s || *s == '-' || *s == '+' || std::isspace((unsigned char)*s)) return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (end == s || *end != '\0' || errno != 0) return false;
    out = (uint64_t)v;
    return true;
}

std::vector<std::string> SimulationConfig::sanitize() {
    const SimulationConfig d{};
    std::vector<std::string> reset;
    auto fix = [&reset](bool ok, const char* name, auto& field, const auto& def) {
        if (!ok) { field = def; reset.emplace_back(name); }
    };
    fix(maxPopulation > 0, "maxPopulation", maxPopulation, d.maxPopulation);
    fix(emissionInterval > 0, "emissionInterval", emissionInterval, d.emissionInterval);
    bool bandOk = emitterYMin <= emitterYMax;
    fix(bandOk, "emitterYMin", emitterYMin, d.emitterYMin);
    fix(bandOk, "emitterYMax", emitterYMax, d.emitterYMax);
    fix(angularHalfWidth >= 0.0, "angularHalfWidth", angularHalfWidth, d.angularHalfWidth);
    fix(particleSpeed > 0.0, "particleSpeed", particleSpeed, d.particleSpeed);
    fix(energySpreadFraction >= 0.0, "energySpreadFraction", energySpreadFraction, d.energySpreadFraction);
    fix(beamEnergyMeV > 0.0 && std::isfinite(beamEnergyMeV), "beamEnergyMeV", beamEnergyMeV, d.beamEnergyMeV);
    fix(dt > 0.0, "dt", dt, d.dt);
    fix(exitX > emitterX, "exitX", exitX, d.exitX);
    fix(domainWidth > 0.0, "domainWidth", domainWidth, d.domainWidth);
    fix(domainHeight > 0.0, "domainHeight", domainHeight, d.domainHeight);
    fix(matterWidth >= 0.0, "matterWidth", matterWidth, d.matterWidth);
    fix(markerSize > 0, "markerSize", markerSize, d.markerSize);
    fix(tickPeriodMs >= 1 && tickPeriodMs <= 1000, "tickPeriodMs", tickPeriodMs, d.tickPeriodMs);
    fix(idlePollMs >= 1 && idlePollMs <= 1000, "idlePollMs", idlePollMs, d.idlePollMs);
    return reset;
}

void SimulationConfig::applyEnvironment() {
    double v;
    uint64_t u;
    if (parseDouble(std::getenv("FLAVORSIM_BEAM_ENERGY"), v)) beamEnergyMeV = v;
    if (parseUnsigned(std::getenv("FLAVORSIM_TICK_MS"), u) && u <= 1000) tickPeriodMs = (int)u;
    if (parseUnsigned(std::getenv("FLAVORSIM_SEED"), u)) seed = u;
    if (parseDouble(std::getenv("FLAVORSIM_MATTER_START"), v)) matterStartX = v;
    if (parseDouble(std::getenv("FLAVORSIM_MATTER_WIDTH"), v)) matterWidth = v;
}

void applyArguments(int argc, char** argv, SimulationConfig& cfg, RunOptions& opts, std::vector<std::string>& unknown) {
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        // Split "--opt=value"; otherwise the value (if any) is the next argument
        std::string name = a;
        const char* inlineVal = nullptr;
        size_t eq = a.find('=');
        if (a.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = a.substr(0, eq);
            inlineVal = argv[i] + eq + 1;
        }
        auto value = [&]() -> const char* {
            if (inlineVal) return inlineVal;
            if (i + 1 < argc) return argv[++i];
            return nullptr;
        };
        double v;
        uint64_t u;
        if (name == "-e" || name == "--energy") {
            if (parseDouble(value(), v)) cfg.beamEnergyMeV = v;
        } else if (name == "-t" || name == "--tick-ms") {
            if (parseUnsigned(value(), u) && u <= 1000) cfg.tickPeriodMs = (int)u;
        } else if (name == "--seed") {
            if (parseUnsigned(value(), u)) cfg.seed = u;
        } else if (name == "--matter-start") {
            if (parseDouble(value(), v)) cfg.matterStartX = v;
        } else if (name == "--matter-width") {
            if (parseDouble(value(), v)) cfg.matterWidth = v;
        } else if (name == "--isolate-failures") {
            cfg.isolateParticleFailures = true;
        } else if (name == "--headless") {
            opts.headless = true;
        } else if (name == "--ticks") {
            if (parseUnsigned(value(), u) && u > 0) opts.ticks = u;
        } else if (name == "--out") {
            const char* p = value();
            if (p) opts.outPath = p;
        } else if (name == "-h" || name == "--help") {
            opts.showHelp = true;
        } else {
            unknown.push_back(a);
        }
    }
}

std::string usageText(const char* argv0) {
    std::string prog = (argv0 && *argv0) ? std::string(argv0) : std::string("flavorsim");
    return "usage: " + prog + " [options]\n"
           "  -e, --energy MEV        initial beam energy (default 500)\n"
           "  -t, --tick-ms MS        simulation tick period in ms (default 16)\n"
           "      --seed N            random seed (0 = nondeterministic)\n"
           "      --matter-start X    left edge of the dense-matter band (default 400)\n"
           "      --matter-width W    width of the dense-matter band (default 100)\n"
           "      --isolate-failures  drop a failing particle instead of stopping the simulation\n"
           "      --headless          no terminal UI; write snapshots as JSON lines\n"
           "      --ticks N           headless: snapshots to write before exiting (default 600)\n"
           "      --out FILE          headless: output file (default stdout)\n"
           "  -h, --help              show this help\n"
           "environment: FLAVORSIM_BEAM_ENERGY FLAVORSIM_TICK_MS FLAVORSIM_SEED\n"
           "             FLAVORSIM_MATTER_START FLAVORSIM_MATTER_WIDTH LOG_LEVEL\n";
}
