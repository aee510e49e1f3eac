// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef SVGPOLY_MATH_VECTOR2_HPP
#define SVGPOLY_MATH_VECTOR2_HPP

#include "svgpoly/math/vector2/functions.hpp"
#include "svgpoly/math/vector2/io.hpp"
#include "svgpoly/math/vector2/operators.hpp"
#include "svgpoly/math/vector2/unit.hpp"
#include "svgpoly/math/vector2/vector2_fwd.hpp"
#include "svgpoly/math/vector2/vector2_type.hpp"

#endif  // SVGPOLY_MATH_VECTOR2_HPP
