/**
 * @file Vector2D.h
 * @brief Declares Vector2D, the small 2D value type used for particle kinematics.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

/**
 * @struct Vector2D
 * @brief Two-component double vector. Operations return new values; nothing mutates in place.
 */
struct Vector2D {
    double x{0.0};
    double y{0.0};

    Vector2D() = default;
    Vector2D(double x_, double y_) : x(x_), y(y_) {}

    Vector2D operator+(const Vector2D& o) const { return Vector2D(x + o.x, y + o.y); }
    Vector2D operator-(const Vector2D& o) const { return Vector2D(x - o.x, y - o.y); }
    Vector2D operator*(double s) const { return Vector2D(x * s, y * s); }
    /** @brief Divide by @p s; a zero divisor yields the zero vector. */
    Vector2D operator/(double s) const;

    bool operator==(const Vector2D& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Vector2D& o) const { return !(*this == o); }

    /** @brief Euclidean norm. */
    double magnitude() const;
    /** @brief Unit vector in the same direction, or the zero vector when magnitude is zero. */
    Vector2D normalize() const;
    /** @brief True when both components are exactly zero ("no defined direction"). */
    bool isZero() const { return x == 0.0 && y == 0.0; }
};

inline Vector2D operator*(double s, const Vector2D& v) { return v * s; }
