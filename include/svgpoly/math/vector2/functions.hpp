// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef SVGPOLY_MATH_VECTOR2_FUNCTIONS_HPP
#define SVGPOLY_MATH_VECTOR2_FUNCTIONS_HPP

#include <cmath>

#include "svgpoly/math/vector2/operators.hpp"
#include "svgpoly/math/vector2/vector2_type.hpp"

namespace svgpoly::math {

constexpr vector2 add(const vector2& u, const vector2& v) {
    return u + v;
}

constexpr vector2 subtract(const vector2& u, const vector2& v) {
    return u - v;
}

constexpr vector2 scale(const vector2& u, double c) {
    return u * c;
}

// Division by zero is not checked, the result follows IEEE-754 (inf or NaN
// components). Guarding against it is up to the caller.
constexpr vector2 divide(const vector2& u, double c) {
    return u / c;
}

constexpr double dot(const vector2& u, const vector2& v) {
    return u.dot(v);
}

constexpr double cross(const vector2& u, const vector2& v) {
    return u.x * v.y - u.y * v.x;
}

constexpr double norm_sq(const vector2& u) {
    return u.norm_sq();
}

inline double norm(const vector2& u) {
    return std::sqrt(norm_sq(u));
}

// Exact test: anything whose norm rounds to 0.0 counts as zero, including
// tiny vectors like (1e-300, 1e-300) whose squares underflow.
inline bool is_zero(const vector2& u) {
    return norm(u) == 0.0;
}

/**
 * Angle between the vector and the positive x axis.
 *
 * @return value of atan2(y, x) in (-pi, pi], 0 for the zero vector. The sign of a
 *         zero y component is respected, so (-1, -0.0) gives -pi.
 */
inline double radian(const vector2& u) {
    return std::atan2(u.y, u.x);
}

inline bool approx_equal(const vector2& u, const vector2& v, double eps) {
    return std::abs(u.x - v.x) <= eps && std::abs(u.y - v.y) <= eps;
}

}  // namespace svgpoly::math

#endif  // SVGPOLY_MATH_VECTOR2_FUNCTIONS_HPP
