// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#include "svgpoly/math/vector2/io.hpp"

#include <ostream>

namespace svgpoly::math {

// Goes through fmt so that the stream precision and flags have no effect
std::ostream& operator<<(std::ostream& os, const vector2& v) {
    return os << to_string(v);
}

std::ostream& operator<<(std::ostream& os, const zero_vector_error& e) {
    return os << fmt::format("{}", e);
}

std::string to_string(const vector2& v) {
    return fmt::format("{}", v);
}

}  // namespace svgpoly::math
