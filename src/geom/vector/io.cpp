// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#include "geom/vector/io.hpp"

#include <cmath>
#include <cstdlib>
#include <ostream>

namespace geom {

auto format_component(float value) -> std::string {
    if (std::isnan(value)) {
        return "NaN";
    }
    auto text = fmt::format("{}", value);
    auto const e = text.find('e');
    if (e == std::string::npos) {
        return text;
    }

    // fmt gives "d[.ddd]e[+-]XX": shift the decimal point by the exponent
    auto const exponent = std::atoi(text.c_str() + e + 1);
    auto digits = text.substr(0, e);
    auto sign = std::string{};
    if (digits.front() == '-') {
        sign = "-";
        digits.erase(0, 1);
    }
    auto const dot = digits.find('.');
    auto int_digits = static_cast<int>(digits.size());
    if (dot != std::string::npos) {
        int_digits = static_cast<int>(dot);
        digits.erase(dot, 1);
    }

    auto const size = static_cast<int>(digits.size());
    auto const point = int_digits + exponent;
    if (point <= 0) {
        return sign + "0." + std::string(-point, '0') + digits;
    }
    if (point >= size) {
        return sign + digits + std::string(point - size, '0');
    }
    return sign + digits.substr(0, point) + "." + digits.substr(point);
}

auto to_string(const vector& v) -> std::string {
    return fmt::format("{}", v);
}

auto operator<<(std::ostream& os, const vector& v) -> std::ostream& {
    return os << to_string(v);
}

}  // namespace geom
