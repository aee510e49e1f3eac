// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef SVGPOLY_MATH_VECTOR2_IO_HPP
#define SVGPOLY_MATH_VECTOR2_IO_HPP

#include <iosfwd>
#include <string>

#include <fmt/format.h>

#include "svgpoly/math/vector2/unit.hpp"
#include "svgpoly/math/vector2/vector2_type.hpp"

namespace svgpoly::math {

// "(x, y)" with the shortest decimal form of each component. Meant for
// diagnostics, there is no matching parser.
std::ostream& operator<<(std::ostream& os, const vector2& v);

std::ostream& operator<<(std::ostream& os, const zero_vector_error& e);

std::string to_string(const vector2& v);

}  // namespace svgpoly::math

// Format spec, if any, is applied to both components: "{:.2f}" -> "(1.00, 2.00)"
template <>
struct fmt::formatter<svgpoly::math::vector2> : fmt::formatter<double> {
    template <typename FormatContext>
    auto format(const svgpoly::math::vector2& v, FormatContext& ctx) const -> decltype(ctx.out()) {
        auto out = ctx.out();
        *out++ = '(';
        ctx.advance_to(out);
        out = fmt::formatter<double>::format(v.x, ctx);
        *out++ = ',';
        *out++ = ' ';
        ctx.advance_to(out);
        out = fmt::formatter<double>::format(v.y, ctx);
        *out++ = ')';
        return out;
    }
};

template <>
struct fmt::formatter<svgpoly::math::zero_vector_error> : fmt::formatter<svgpoly::math::vector2> {
    template <typename FormatContext>
    auto format(const svgpoly::math::zero_vector_error& e, FormatContext& ctx) const
        -> decltype(ctx.out()) {
        auto out = fmt::format_to(ctx.out(), "zero vector ");
        ctx.advance_to(out);
        return fmt::formatter<svgpoly::math::vector2>::format(e.vector, ctx);
    }
};

#endif  // SVGPOLY_MATH_VECTOR2_IO_HPP
