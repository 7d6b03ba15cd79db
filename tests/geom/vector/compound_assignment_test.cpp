// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#include "geom/vector/vector_2d.hpp"

#include <catch2/catch.hpp>

using geom::vector;

TEST_CASE("Vector compound assignment") {
    auto v = vector::of_int(5, 10);

    v += vector::of_int(1, -2);
    CHECK((v == vector::of_int(6, 8)));

    v -= vector::of_int(2, 2);
    CHECK((v == vector::of_int(4, 6)));

    v *= 3;
    CHECK((v == vector::of_int(12, 18)));

    v /= 2.0f;
    CHECK((v == vector::of_int(6, 9)));

    v *= 0.5;
    CHECK((v == vector::of(3.0f, 4.5f)));

    v /= 3;
    CHECK((v == vector::of(1.0f, 1.5f)));

    SECTION("compound operators return the assigned object") {
        auto u = vector::one();
        (u += vector::one()) *= 2;
        CHECK((u == vector::of_int(4, 4)));

        (u /= 4) -= vector::y_axis();
        CHECK((u == vector::x_axis()));
    }
}
