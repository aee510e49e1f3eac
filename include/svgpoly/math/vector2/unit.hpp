// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef SVGPOLY_MATH_VECTOR2_UNIT_HPP
#define SVGPOLY_MATH_VECTOR2_UNIT_HPP

#include <stdexcept>

#include "svgpoly/math/vector2/functions.hpp"
#include "svgpoly/math/vector2/vector2_type.hpp"

namespace svgpoly::math {

// Normalization of a vector with no direction. Payload is always the origin.
struct zero_vector_error {
    vector2 vector = origin();
};

constexpr bool operator==(const zero_vector_error& a, const zero_vector_error& b) {
    return a.vector == b.vector;
}

constexpr bool operator!=(const zero_vector_error& a, const zero_vector_error& b) {
    return !(a == b);
}

// Thrown when unit_result is accessed the wrong way, e.g. value() of a failed
// normalization.
class bad_unit_access : public std::logic_error {
public:
    explicit bad_unit_access(const char* what);
};

/**
 * Outcome of normalizing a vector: either a unit vector or zero_vector_error.
 *
 * Inspect with @c has_value() (or conversion to bool) before calling @c value()
 * or @c error(); the wrong accessor throws @c bad_unit_access.
 */
class unit_result {
private:
    vector2 vec_;
    bool ok_;

public:
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr unit_result(vector2 u) noexcept
    : vec_{u}
    , ok_{true} { }

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr unit_result(zero_vector_error err) noexcept
    : vec_{err.vector}
    , ok_{false} { }

    constexpr bool has_value() const noexcept { return ok_; }

    constexpr explicit operator bool() const noexcept { return ok_; }

    const vector2& value() const;

    zero_vector_error error() const;

    constexpr vector2 value_or(const vector2& fallback) const noexcept {
        return ok_ ? vec_ : fallback;
    }
};

/**
 * Vector of the same direction and length 1 (up to rounding).
 *
 * @param u vector to normalize
 * @return @c u / norm(u), or zero_vector_error carrying the origin if norm(u) == 0
 */
inline unit_result unit(const vector2& u) {
    double n = norm(u);
    if (n == 0.0) {
        return zero_vector_error{origin()};
    }
    return divide(u, n);
}

}  // namespace svgpoly::math

#endif  // SVGPOLY_MATH_VECTOR2_UNIT_HPP
