// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef GEOM_VECTOR_IO_HPP
#define GEOM_VECTOR_IO_HPP

#include <iosfwd>
#include <string>

#include <fmt/format.h>

#include "geom/vector/vector_2d.hpp"

namespace geom {

// Shortest round-trip digits, always positional ("0.0000001", not "1e-07").
// Non-finite values print as "NaN", "inf" and "-inf".
auto format_component(float value) -> std::string;

// "<x, y>" with components as produced by format_component
auto to_string(const vector& v) -> std::string;

auto operator<<(std::ostream& os, const vector& v) -> std::ostream&;

}  // namespace geom

// Format spec, if any, applies to both components: "{:.2f}" -> "<1.00, 2.00>"
template <>
struct fmt::formatter<geom::vector> : fmt::formatter<float> {
    bool plain = true;

    template <typename ParseContext>
    FMT_CONSTEXPR auto parse(ParseContext& ctx) -> decltype(ctx.begin()) {
        auto const it = ctx.begin();
        plain = it == ctx.end() || *it == '}';
        return fmt::formatter<float>::parse(ctx);
    }

    template <typename FormatContext>
    auto format(const geom::vector& v, FormatContext& ctx) const -> decltype(ctx.out()) {
        if (plain) {
            return fmt::format_to(ctx.out(), "<{}, {}>", geom::format_component(v.x),
                                  geom::format_component(v.y));
        }
        auto out = fmt::format_to(ctx.out(), "<");
        ctx.advance_to(out);
        out = fmt::formatter<float>::format(v.x, ctx);
        out = fmt::format_to(out, ", ");
        ctx.advance_to(out);
        out = fmt::formatter<float>::format(v.y, ctx);
        return fmt::format_to(out, ">");
    }
};

#endif  // GEOM_VECTOR_IO_HPP
