// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#include "svgpoly/math/vector2/unit.hpp"

namespace svgpoly::math {

bad_unit_access::bad_unit_access(const char* what)
: std::logic_error{what} { }

const vector2& unit_result::value() const {
    if (!ok_) {
        throw bad_unit_access{"unit_result::value(): normalization of a zero vector"};
    }
    return vec_;
}

zero_vector_error unit_result::error() const {
    if (ok_) {
        throw bad_unit_access{"unit_result::error(): normalization succeeded"};
    }
    return zero_vector_error{vec_};
}

}  // namespace svgpoly::math
