// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef GEOM_VECTOR_VECTOR_FWD_HPP
#define GEOM_VECTOR_VECTOR_FWD_HPP

namespace geom {

// Per-component tolerance used by vector equality
constexpr float float_limit = 1e-6f;

struct vector;

}  // namespace geom

#endif  // GEOM_VECTOR_VECTOR_FWD_HPP
