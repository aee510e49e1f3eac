// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef SVGPOLY_MATH_VECTOR2_OPERATORS_HPP
#define SVGPOLY_MATH_VECTOR2_OPERATORS_HPP

#include "svgpoly/math/vector2/vector2_type.hpp"

namespace svgpoly::math {

constexpr vector2 operator+(vector2 u, const vector2& v) {
    u += v;
    return u;
}

constexpr vector2 operator-(vector2 u, const vector2& v) {
    u -= v;
    return u;
}

constexpr vector2 operator*(double a, vector2 u) {
    u *= a;
    return u;
}

constexpr vector2 operator*(vector2 u, double a) {
    u *= a;
    return u;
}

constexpr vector2 operator/(vector2 u, double a) {
    u /= a;
    return u;
}

// Exact comparison, (NaN, 0) != (NaN, 0)
constexpr bool operator==(const vector2& u, const vector2& v) {
    return u.x == v.x && u.y == v.y;
}

constexpr bool operator!=(const vector2& u, const vector2& v) {
    return !(u == v);
}

}  // namespace svgpoly::math

#endif  // SVGPOLY_MATH_VECTOR2_OPERATORS_HPP
