/**
 * @file Vector2D.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Vector2D.h"

#include <cmath>

Vector2D Vector2D::operator/(double s) const {
    if (s == 0.0) return Vector2D();
    return Vector2D(x / s, y / s);
}

double Vector2D::magnitude() const {
    return std::sqrt(x * x + y * y);
}

Vector2D Vector2D::normalize() const {
    double m = magnitude();
    if (m == 0.0) return Vector2D();
    return *this / m;
}
