/**
 * @file Snapshot.cpp
 * @brief Snapshot helpers: flavor-to-color encoding and the JSON line writer used by headless mode.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Snapshot.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <ostream>

namespace {
inline int channel8(double p) {
    if (!(p == p)) return 0; // NaN
    long v = std::lround(p * 255.0);
    if (v < 0) v = 0;
    if (v > 255) v = 255;
    return (int)v;
}

inline int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}
}

void Snapshot::clear() {
    x.clear(); y.clear(); color.clear(); size.clear();
    metrics = Metrics{};
}

void Snapshot::reserve(size_t n) {
    x.reserve(n); y.reserve(n); color.reserve(n); size.reserve(n);
}

bool Snapshot::wellFormed() const {
    size_t n = metrics.count;
    return x.size() == n && y.size() == n && color.size() == n && size.size() == n;
}

std::string flavorColorHex(const std::array<double, 3>& probs) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", channel8(probs[0]), channel8(probs[1]), channel8(probs[2]));
    return std::string(buf);
}

bool parseColorHex(const std::string& hex, int& r, int& g, int& b) {
    if (hex.size() != 7 || hex[0] != '#') return false;
    int v[6];
    for (int i = 0; i < 6; ++i) {
        v[i] = hexDigit(hex[(size_t)i + 1]);
        if (v[i] < 0) return false;
    }
    r = v[0] * 16 + v[1];
    g = v[2] * 16 + v[3];
    b = v[4] * 16 + v[5];
    return true;
}

void writeSnapshotJson(std::ostream& os, const Snapshot& s) {
    std::ios::fmtflags oldFlags = os.flags();
    std::streamsize oldPrec = os.precision();
    os << std::setprecision(std::numeric_limits<double>::max_digits10);
    auto writeNums = [&os](const auto& v) {
        os << '[';
        for (size_t i = 0; i < v.size(); ++i) {
            if (i) os << ',';
            os << v[i];
        }
        os << ']';
    };
    os << "{\"tick\":" << s.tick << ",\"agents\":{\"x\":";
    writeNums(s.x);
    os << ",\"y\":";
    writeNums(s.y);
    os << ",\"color\":[";
    for (size_t i = 0; i < s.color.size(); ++i) {
        if (i) os << ',';
        os << '"' << s.color[i] << '"';
    }
    os << "],\"size\":";
    writeNums(s.size);
    os << "},\"metrics\":{\"avg_energy\":" << s.metrics.avgEnergy
       << ",\"count\":" << s.metrics.count << "}}\n";
    os.flags(oldFlags);
    os.precision(oldPrec);
}
