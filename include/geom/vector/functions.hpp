// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef GEOM_VECTOR_FUNCTIONS_HPP
#define GEOM_VECTOR_FUNCTIONS_HPP

#include "geom/util.hpp"
#include "geom/vector/vector_2d.hpp"

namespace geom {

constexpr inline float dot(const vector& u, const vector& v) {
    return u.dot(v);
}

constexpr inline float cross(const vector& u, const vector& v) {
    return u.cross(v);
}

constexpr inline float length_squared(const vector& u) {
    return u.length_squared();
}

inline float length(const vector& u) {
    return u.length();
}

inline vector normalized(const vector& u) {
    return u.normalized();
}

constexpr inline vector clamp(const vector& u, const vector& min_bound, const vector& max_bound) {
    return u.clamp(min_bound, max_bound);
}

inline bool approx_equal(const vector& u, const vector& v, float eps) {
    return approx_equal(u.x, v.x, eps) && approx_equal(u.y, v.y, eps);
}

}  // namespace geom

#endif  // GEOM_VECTOR_FUNCTIONS_HPP
