// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef GEOM_VECTOR_VECTOR_2D_HPP
#define GEOM_VECTOR_VECTOR_2D_HPP

#include <algorithm>
#include <cmath>

#include "geom/util.hpp"
#include "geom/vector/vector_fwd.hpp"

namespace geom {

// Point or displacement in the plane. Plain value, no validation: non-finite
// components propagate through every operation.
struct vector {
    float x, y;

    static constexpr vector zero() { return {0.0f, 0.0f}; }

    static constexpr vector x_axis() { return {1.0f, 0.0f}; }

    static constexpr vector y_axis() { return {0.0f, 1.0f}; }

    static constexpr vector one() { return {1.0f, 1.0f}; }

    static constexpr vector of(float x, float y) { return {x, y}; }

    static constexpr vector of_int(int x, int y) {
        return {narrow_cast<float>(x), narrow_cast<float>(y)};
    }

    // Cheaper than length() when only comparing magnitudes
    constexpr float length_squared() const { return x * x + y * y; }

    float length() const { return std::sqrt(length_squared()); }

    constexpr float dot(const vector& v) const { return x * v.x + y * v.y; }

    // Positive when v lies counter-clockwise from this vector
    constexpr float cross(const vector& v) const { return x * v.y - y * v.x; }

    constexpr vector x_component() const { return {x, 0.0f}; }

    constexpr vector y_component() const { return {0.0f, y}; }

    // Zero components give infinities
    constexpr vector reciprocal() const { return {1.0f / x, 1.0f / y}; }

    constexpr vector times(const vector& v) const { return {x * v.x, y * v.y}; }

    // Undefined (NaN components) for the zero vector
    vector normalized() const {
        auto const len = length();
        return {x / len, y / len};
    }

    // Lower bound is applied first, so the upper bound wins when the bounds
    // of an axis are swapped.
    constexpr vector clamp(const vector& min_bound, const vector& max_bound) const {
        return {
            std::min(max_bound.x, std::max(min_bound.x, x)),
            std::min(max_bound.y, std::max(min_bound.y, y)),
        };
    }

    constexpr vector operator-() const { return {-x, -y}; }

    friend constexpr vector operator+(const vector& u, const vector& v) {
        return {u.x + v.x, u.y + v.y};
    }

    friend constexpr vector operator-(const vector& u, const vector& v) { return u + (-v); }

    constexpr vector& operator+=(const vector& v) {
        *this = *this + v;
        return *this;
    }

    constexpr vector& operator-=(const vector& v) {
        *this = *this - v;
        return *this;
    }

    // Scalars of any numeric type other than bool are converted to float first
    template <typename Scalar, typename = enable_if_number_t<Scalar>>
    friend constexpr vector operator*(const vector& u, Scalar a) {
        auto const s = narrow_cast<float>(a);
        return {u.x * s, u.y * s};
    }

    template <typename Scalar, typename = enable_if_number_t<Scalar>>
    friend constexpr vector operator*(Scalar a, const vector& u) {
        return u * a;
    }

    template <typename Scalar, typename = enable_if_number_t<Scalar>>
    friend constexpr vector operator/(const vector& u, Scalar a) {
        auto const s = narrow_cast<float>(a);
        return {u.x / s, u.y / s};
    }

    template <typename Scalar, typename = enable_if_number_t<Scalar>>
    constexpr vector& operator*=(Scalar a) {
        *this = *this * a;
        return *this;
    }

    template <typename Scalar, typename = enable_if_number_t<Scalar>>
    constexpr vector& operator/=(Scalar a) {
        *this = *this / a;
        return *this;
    }

    friend bool operator==(const vector& u, const vector& v) {
        return approx_equal(u.x, v.x, float_limit) && approx_equal(u.y, v.y, float_limit);
    }

    friend bool operator!=(const vector& u, const vector& v) { return !(u == v); }
};

}  // namespace geom

#endif  // GEOM_VECTOR_VECTOR_2D_HPP
