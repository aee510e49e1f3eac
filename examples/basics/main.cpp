// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#include <fmt/core.h>

#include "svgpoly/math/vector2.hpp"

namespace math = svgpoly::math;

void describe_direction(const math::vector2& v) {
    if (auto u = math::unit(v)) {
        fmt::print("unit({}) = {:.6f}, angle = {:.6f} rad\n", v, u.value(), math::radian(v));
    } else {
        fmt::print("unit({}) failed: {}\n", v, u.error());
    }
}

int main() {
    auto a = math::vector2{3, 4};
    auto b = math::vector2{-1, 2.5};

    fmt::print("a = {}, b = {}\n", a, b);
    fmt::print("a + b = {}\n", math::add(a, b));
    fmt::print("a - b = {}\n", math::subtract(a, b));
    fmt::print("2a    = {}\n", math::scale(a, 2));
    fmt::print("a / 2 = {}\n", math::divide(a, 2));
    fmt::print("|a|   = {}\n", math::norm(a));
    fmt::print("a . b = {}, a x b = {}\n", math::dot(a, b), math::cross(a, b));

    describe_direction(a);
    describe_direction(b);
    describe_direction(math::subtract(a, a));

    // Unchecked division
    fmt::print("a / 0 = {}\n", math::divide(a, 0));
}
