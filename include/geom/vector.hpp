// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef GEOM_VECTOR_HPP
#define GEOM_VECTOR_HPP

#include "geom/vector/functions.hpp"
#include "geom/vector/io.hpp"
#include "geom/vector/vector_2d.hpp"
#include "geom/vector/vector_fwd.hpp"

#endif  // GEOM_VECTOR_HPP
