// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef SVGPOLY_MATH_VECTOR2_VECTOR2_TYPE_HPP
#define SVGPOLY_MATH_VECTOR2_VECTOR2_TYPE_HPP

#include "svgpoly/math/vector2/vector2_fwd.hpp"

namespace svgpoly::math {

// Point or displacement in the plane. Components are stored verbatim, NaN and
// infinities included; nothing is validated.
struct vector2 {
    double x, y;

    constexpr vector2& operator+=(const vector2& v) {
        x += v.x;
        y += v.y;
        return *this;
    }

    constexpr vector2& operator-=(const vector2& v) {
        x -= v.x;
        y -= v.y;
        return *this;
    }

    constexpr vector2 operator-() const { return {-x, -y}; }

    constexpr vector2& operator*=(double a) {
        x *= a;
        y *= a;
        return *this;
    }

    // Plain IEEE division, no check for a == 0
    constexpr vector2& operator/=(double a) {
        x /= a;
        y /= a;
        return *this;
    }

    constexpr double dot(const vector2& v) const { return x * v.x + y * v.y; }

    constexpr double norm_sq() const { return x * x + y * y; }
};

constexpr vector2 make_vector(double x, double y) noexcept {
    return {x, y};
}

constexpr vector2 origin() noexcept {
    return {0.0, 0.0};
}

}  // namespace svgpoly::math

#endif  // SVGPOLY_MATH_VECTOR2_VECTOR2_TYPE_HPP
