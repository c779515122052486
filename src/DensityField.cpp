/**
 * @file DensityField.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "DensityField.h"

DensityField::DensityField(double startX, double width) : start(startX), span(width) {}

bool DensityField::isDense(const Vector2D& p) const {
    return p.x > start && p.x < start + span;
}
