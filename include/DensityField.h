/**
 * @file DensityField.h
 * @brief Declares DensityField, the static "dense matter" band crossing the chamber.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Vector2D.h"

/**
 * @class DensityField
 * @brief Vertical band of dense matter spanning x in (start, start + width); y is unconstrained.
 */
class DensityField {
public:
    DensityField(double startX = 400.0, double width = 100.0);

    /** @brief True iff @p p.x lies strictly inside the band. */
    bool isDense(const Vector2D& p) const;

    double startX() const { return start; }
    double width() const { return span; }
    double endX() const { return start + span; }

private:
    double start;
    double span;
};
