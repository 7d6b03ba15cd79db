// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef GEOM_UTIL_HPP
#define GEOM_UTIL_HPP

#include <cmath>
#include <type_traits>
#include <utility>

namespace geom {

// Integer and floating point types; bool is excluded
template <typename T>
constexpr bool is_number_v = std::is_arithmetic_v<T> && !std::is_same_v<T, bool>;

template <typename T>
using enable_if_number_t = std::enable_if_t<is_number_v<T>>;

template <typename T, typename U>
constexpr T narrow_cast(U&& u) noexcept {
    return static_cast<T>(std::forward<U>(u));
}

// Strict: |a - b| must be below eps, so eps = 0 never holds
inline bool approx_equal(float a, float b, float eps) {
    return std::abs(a - b) < eps;
}

}  // namespace geom

#endif  // GEOM_UTIL_HPP
