/**
 * @file Snapshot.h
 * @brief Declares Snapshot, the render-ready record published once per running tick, and its formatters.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

/**
 * @struct Snapshot
 * @brief Per-tick view of the live particles. All agent arrays are index-aligned and have length metrics.count.
 */
struct Snapshot {
    struct Metrics {
        double avgEnergy{0.0};
        size_t count{0};
    };

    uint64_t tick{0};
    std::vector<double> x;
    std::vector<double> y;
    std::vector<std::string> color; // "#rrggbb", lowercase
    std::vector<int> size;
    Metrics metrics;

    /** @brief Drop all agents, keeping capacity for reuse. */
    void clear();
    /** @brief Pre-size the agent arrays for @p n particles. */
    void reserve(size_t n);
    /** @brief True when every agent array has metrics.count entries. */
    bool wellFormed() const;
};

/** @brief Map a flavor-probability triple to "#rrggbb"; each channel is round(p*255) clamped to [0,255]. */
std::string flavorColorHex(const std::array<double, 3>& probs);

/** @brief Parse "#rrggbb" into 0..255 components. Returns false for anything else. */
bool parseColorHex(const std::string& hex, int& r, int& g, int& b);

/** @brief Write @p s as one JSON object on a single line (tick, agents{x,y,color,size}, metrics). */
void writeSnapshotJson(std::ostream& os, const Snapshot& s);
