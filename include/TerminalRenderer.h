/**
 * @file TerminalRenderer.h
 * @brief Declares TerminalRenderer: draws beam snapshots and the dense-matter band with ncurses.
 *
 * The renderer is a pure consumer. It never touches engine state; it only draws what a Snapshot carries
 * plus a caller-supplied status.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <string>
#include <ncurses.h>

#include "Snapshot.h"

/**
 * @class TerminalRenderer
 * @brief Maps the simulation domain onto the terminal grid (last row reserved for the status line).
 */
class TerminalRenderer {
public:
    // Color pairs initialized by initColors()
    enum Pair { ElectronPair = 1, MuonPair = 2, MixedPair = 3, MatterPair = 4, TauPair = 5, StatusPair = 6 };

    /** @brief Status fields shown on the bottom line. */
    struct Status {
        bool running{false};
        bool failed{false};
        double beamEnergyMeV{0.0};
        size_t maxPopulation{0};
        uint64_t dropped{0};
    };

    TerminalRenderer(double domainWidth, double domainHeight, double matterStartX, double matterWidth);

    /** @brief Define the color pairs used for flavors and the matter band. */
    static void initColors();

    /** @brief Full redraw of @p w: matter band, particles of @p s, and status line. */
    void draw(WINDOW* w, const Snapshot& s, const Status& st);
    /** @brief Redraw only the status line using the last drawn snapshot's tick/count. */
    void drawStatusLine(WINDOW* w, const Status& st);

    /** @brief Choose a color pair from a "#rrggbb" flavor color: dominant red/green/blue, else mixed. */
    static int colorPairForHex(const std::string& hex);
    /** @brief Map a domain point to a terminal cell in a @p cols x @p rows grid (y axis points up). */
    bool toCell(double x, double y, int cols, int rows, int& cx, int& cy) const;

private:
    void drawMatterBand(WINDOW* w, int cols, int rows);

    double domainW;
    double domainH;
    double matterStart;
    double matterWidth;
    uint64_t lastTick{0};
    size_t lastCount{0};
};
