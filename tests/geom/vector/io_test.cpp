// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#include "geom/vector/io.hpp"

#include <sstream>

#include <catch2/catch.hpp>
#include <fmt/format.h>

using geom::vector;

TEST_CASE("Float component formatting") {
    CHECK(geom::format_component(6.0f) == "6");
    CHECK(geom::format_component(-0.25f) == "-0.25");
    CHECK(geom::format_component(1e-7f) == "0.0000001");
    CHECK(geom::format_component(1.25e-5f) == "0.0000125");
    CHECK(geom::format_component(3e9f) == "3000000000");
    CHECK(geom::format_component(-1e20f) == "-100000000000000000000");
}

TEST_CASE("Vector text representation") {
    CHECK(geom::to_string(vector::of_int(6, 8)) == "<6, 8>");
    CHECK(geom::to_string(vector::of(0.5f, -2.25f)) == "<0.5, -2.25>");
    CHECK(geom::to_string(vector::of(0.1f, 3.0f)) == "<0.1, 3>");
    CHECK(geom::to_string(vector::zero()) == "<0, 0>");

    SECTION("very small and very large components are written out in full") {
        CHECK(geom::to_string(vector::of(1e-7f, 1e20f)) == "<0.0000001, 100000000000000000000>");
        CHECK(geom::to_string(vector::of(-1.5e-8f, 2.5e12f)) == "<-0.000000015, 2500000000000>");
    }

    SECTION("non-finite components") {
        CHECK(geom::to_string(vector::of(0.0f, -2.0f).reciprocal()) == "<inf, -0.5>");
        CHECK(geom::to_string(vector::zero().normalized()) == "<NaN, NaN>");
    }

    SECTION("stream insertion") {
        std::ostringstream os;
        os << vector::of_int(5, 10) + vector::of_int(1, -2);
        CHECK(os.str() == "<6, 8>");
    }

    SECTION("fmt formatting") {
        CHECK(fmt::format("{}", vector::one() / 4) == "<0.25, 0.25>");
        CHECK(fmt::format("v = {}", vector::x_axis()) == "v = <1, 0>");
    }

    SECTION("format spec applies to both components") {
        CHECK(fmt::format("{:.2f}", vector::of_int(1, 2)) == "<1.00, 2.00>");
        CHECK(fmt::format("{:>4}", vector::of_int(1, -2)) == "<   1,   -2>");
    }
}
