// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef GEOM_CONFIG_HPP
#define GEOM_CONFIG_HPP

#include <string_view>

namespace geom {

struct version_info {
    std::string_view core;
    std::string_view commit;
    std::string_view full;
    int major;
    int minor;
    int patch;
};

auto version() -> version_info;

}  // namespace geom

#endif  // GEOM_CONFIG_HPP
