// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#include "svgpoly/math/vector2/unit.hpp"

#include <cmath>
#include <limits>
#include <vector>

#include <catch2/catch.hpp>

namespace math = svgpoly::math;
using Catch::Matchers::WithinAbs;
using math::vector2;

TEST_CASE("Normalization of a non-zero vector", "[vector][unit]") {
    auto result = math::unit({3, 4});

    REQUIRE(result.has_value());
    REQUIRE(static_cast<bool>(result));

    SECTION("Gives vector of the same direction and unit length") {
        CHECK(result.value() == vector2{0.6, 0.8});
    }

    SECTION("value_or ignores the fallback") {
        CHECK(result.value_or({7, 7}) == vector2{0.6, 0.8});
    }

    SECTION("Accessing the error throws") {
        CHECK_THROWS_AS(result.error(), math::bad_unit_access);
    }

    SECTION("Negative components") {
        auto r = math::unit({-5, 0});
        REQUIRE(r);
        CHECK(r.value() == vector2{-1, 0});
    }
}

TEST_CASE("Normalization of the zero vector", "[vector][unit]") {
    auto result = math::unit(math::origin());

    REQUIRE_FALSE(result.has_value());
    REQUIRE_FALSE(static_cast<bool>(result));

    SECTION("Error carries the origin") {
        CHECK(result.error() == math::zero_vector_error{});
        CHECK(result.error().vector == vector2{0, 0});
    }

    SECTION("value_or returns the fallback") {
        CHECK(result.value_or({1, 0}) == vector2{1, 0});
    }

    SECTION("Accessing the value throws") {
        CHECK_THROWS_AS(result.value(), math::bad_unit_access);
        CHECK_THROWS_WITH(result.value(), Catch::Contains("zero vector"));
    }

    SECTION("Negative zero is zero too") {
        CHECK_FALSE(math::unit({-0.0, 0.0}));
    }

    SECTION("Vector whose norm underflows cannot be normalized") {
        auto r = math::unit({1e-300, -1e-300});
        REQUIRE_FALSE(r);
        CHECK(r.error().vector == math::origin());
    }
}

TEST_CASE("Normalization of non-finite vectors", "[vector][unit]") {
    SECTION("NaN component propagates") {
        auto r = math::unit({std::numeric_limits<double>::quiet_NaN(), 0});
        REQUIRE(r);
        CHECK(std::isnan(r.value().x));
        CHECK(std::isnan(r.value().y));
    }

    SECTION("Overflowing norm collapses to the origin") {
        auto r = math::unit({1e200, 1e200});
        REQUIRE(r);
        CHECK(r.value() == math::origin());
    }

    SECTION("Infinite component gives NaN") {
        auto r = math::unit({std::numeric_limits<double>::infinity(), 1});
        REQUIRE(r);
        CHECK(std::isnan(r.value().x));
        CHECK(r.value().y == 0.0);
    }
}

TEST_CASE("Normalized vectors have unit length", "[vector][unit]") {
    auto vs = std::vector<vector2>{
        {1, 0},   {0, -2},      {3, 4},        {-2.5, 7.125}, {1e-8, 3e-9},
        {1e10, -1}, {0.1, 0.2}, {123.456, -654.321}, {1e-150, 1e-150}, {1e150, -1e150},
    };

    for (auto v : vs) {
        auto u = math::unit(v);
        INFO("v = (" << v.x << ", " << v.y << ")");
        REQUIRE(u);
        CHECK_THAT(math::norm(u.value()), WithinAbs(1.0, 1e-12));
        CHECK(math::radian(u.value()) == Approx(math::radian(v)));
    }
}

TEST_CASE("Normalization is usable in constant expressions", "[vector][unit]") {
    constexpr auto ok = math::unit_result{vector2{1, 0}};
    constexpr auto err = math::unit_result{math::zero_vector_error{}};
    static_assert(ok.has_value());
    static_assert(!err.has_value());
    static_assert(err.value_or({0, 1}) == vector2{0, 1});
    CHECK(ok.value() == vector2{1, 0});
}
