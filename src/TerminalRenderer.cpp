/**
 * @file TerminalRenderer.cpp
 * @brief ncurses drawing of beam snapshots: dense-matter band, flavor-colored particles, status line.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "TerminalRenderer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace {
inline int clampi(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }
}

TerminalRenderer::TerminalRenderer(double domainWidth, double domainHeight, double matterStartX, double matterWidth_)
    : domainW(domainWidth), domainH(domainHeight), matterStart(matterStartX), matterWidth(matterWidth_) {}

void TerminalRenderer::initColors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    init_pair(ElectronPair, COLOR_RED, -1);
    init_pair(MuonPair, COLOR_GREEN, -1);
    init_pair(MixedPair, COLOR_YELLOW, -1);
    init_pair(MatterPair, COLOR_YELLOW, -1);
    init_pair(TauPair, COLOR_BLUE, -1);
    init_pair(StatusPair, COLOR_WHITE, -1);
}

int TerminalRenderer::colorPairForHex(const std::string& hex) {
    int r = 0, g = 0, b = 0;
    if (!parseColorHex(hex, r, g, b)) return StatusPair;
    // A channel dominates when it carries at least two thirds of the total
    int total = r + g + b;
    if (total <= 0) return StatusPair;
    if (r * 3 >= total * 2) return ElectronPair;
    if (g * 3 >= total * 2) return MuonPair;
    if (b * 3 >= total * 2) return TauPair;
    return MixedPair;
}

bool TerminalRenderer::toCell(double x, double y, int cols, int rows, int& cx, int& cy) const {
    if (cols < 1 || rows < 1 || !(domainW > 0.0) || !(domainH > 0.0)) return false;
    if (!std::isfinite(x) || !std::isfinite(y)) return false;
    if (x < 0.0 || x >= domainW || y < 0.0 || y >= domainH) return false;
    cx = clampi((int)std::floor(x / domainW * cols), 0, cols - 1);
    cy = clampi(rows - 1 - (int)std::floor(y / domainH * rows), 0, rows - 1);
    return true;
}

void TerminalRenderer::drawMatterBand(WINDOW* w, int cols, int rows) {
    int x0 = 0, x1 = 0, dummy = 0;
    // Band edges may lie outside the visible domain; clamp to the grid
    double left = std::max(0.0, matterStart);
    double right = std::min(domainW - 1e-9, matterStart + matterWidth);
    if (right <= left) return;
    if (!toCell(left, 0.0, cols, rows, x0, dummy)) return;
    if (!toCell(right, 0.0, cols, rows, x1, dummy)) return;
    wattron(w, COLOR_PAIR(MatterPair));
    for (int cy = 0; cy < rows; ++cy) {
        for (int cx = x0; cx <= x1; ++cx) mvwaddch(w, cy, cx, ':');
    }
    wattroff(w, COLOR_PAIR(MatterPair));
    if (x1 - x0 >= 4) {
        wattron(w, COLOR_PAIR(MatterPair) | A_BOLD);
        mvwaddnstr(w, 0, x0 + 1, "matter", x1 - x0 - 1);
        wattroff(w, COLOR_PAIR(MatterPair) | A_BOLD);
    }
}

void TerminalRenderer::draw(WINDOW* w, const Snapshot& s, const Status& st) {
    if (!w) return;
    int rows, cols; getmaxyx(w, rows, cols);
    int gridRows = rows - 1;
    werase(w);
    if (gridRows >= 1 && cols >= 1) {
        drawMatterBand(w, cols, gridRows);
        size_t n = std::min(s.x.size(), std::min(s.y.size(), s.color.size()));
        for (size_t i = 0; i < n; ++i) {
            int cx, cy;
            if (!toCell(s.x[i], s.y[i], cols, gridRows, cx, cy)) continue;
            int pair = colorPairForHex(s.color[i]);
            wattron(w, COLOR_PAIR(pair) | A_BOLD);
            mvwaddch(w, cy, cx, 'o');
            wattroff(w, COLOR_PAIR(pair) | A_BOLD);
        }
    }
    lastTick = s.tick;
    lastCount = s.metrics.count;
    drawStatusLine(w, st);
}

void TerminalRenderer::drawStatusLine(WINDOW* w, const Status& st) {
    if (!w) return;
    int rows, cols; getmaxyx(w, rows, cols);
    int y = rows - 1;
    wmove(w, y, 0); wclrtoeol(w);
    const char* state = st.failed ? "FAILED" : (st.running ? "RUNNING" : "STOPPED");
    char status[256];
    snprintf(status, sizeof(status),
             "[s]tart [p]stop energy[-/+] [q]uit | Tick: %llu  Particles: %zu/%zu  E: %.0f MeV  %s  Dropped: %llu",
             (unsigned long long)lastTick, lastCount, st.maxPopulation, st.beamEnergyMeV, state,
             (unsigned long long)st.dropped);
    wattron(w, COLOR_PAIR(StatusPair));
    mvwaddnstr(w, y, 0, status, cols);
    wattroff(w, COLOR_PAIR(StatusPair));
    // Legend on the right when there is room
    const char* legend = " red=e green=mu ";
    int lx = cols - (int)std::strlen(legend);
    if (lx > (int)std::strlen(status)) {
        wattron(w, COLOR_PAIR(ElectronPair)); mvwaddstr(w, y, lx, " red=e"); wattroff(w, COLOR_PAIR(ElectronPair));
        wattron(w, COLOR_PAIR(MuonPair)); mvwaddstr(w, y, lx + 6, " green=mu "); wattroff(w, COLOR_PAIR(MuonPair));
    }
    wnoutrefresh(w);
}
