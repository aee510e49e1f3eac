// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef SVGPOLY_MATH_VECTOR2_VECTOR2_FWD_HPP
#define SVGPOLY_MATH_VECTOR2_VECTOR2_FWD_HPP

namespace svgpoly::math {

struct vector2;

}  // namespace svgpoly::math

#endif  // SVGPOLY_MATH_VECTOR2_VECTOR2_FWD_HPP
