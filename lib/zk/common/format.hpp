/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_COMMON_FORMAT_HPP
#define ZEROKIT_COMMON_FORMAT_HPP

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#       pragma GCC diagnostic ignored "-Warray-bounds"
#       pragma GCC diagnostic ignored "-Wstringop-overflow"
#   endif
#endif
#include <fmt/core.h>
#include <fmt/format.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

namespace zerokit {
    // Writes the items between the brackets separated by commas; fmt_item(out_it, item) -> out_it formats one item.
    template<typename OutIt, typename R, typename F>
    OutIt format_sequence(OutIt out_it, const R &items, const std::string_view open, const std::string_view close, const F &fmt_item)
    {
        out_it = fmt::format_to(out_it, "{}", open);
        bool first = true;
        for (const auto &item: items) {
            if (!first)
                out_it = fmt::format_to(out_it, ", ");
            out_it = fmt_item(out_it, item);
            first = false;
        }
        return fmt::format_to(out_it, "{}", close);
    }
}

namespace fmt {
    // byte views and byte arrays are printed as uppercase hex
    template<>
    struct formatter<std::span<const uint8_t>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::span<const uint8_t> &data, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = ctx.out();
            for (const uint8_t v: data)
                out_it = fmt::format_to(out_it, "{:02X}", v);
            return out_it;
        }
    };

    template<size_t SZ>
    struct formatter<std::array<uint8_t, SZ>>: formatter<std::span<const uint8_t>> {
    };

    template<typename X, typename Y>
    struct formatter<std::pair<X, Y>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "({}, {})", v.first, v.second);
        }
    };

    template<typename T, typename A>
    struct formatter<std::vector<T, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return zerokit::format_sequence(ctx.out(), v, "[", "]", [](auto out_it, const auto &item) {
                return fmt::format_to(out_it, "{}", item);
            });
        }
    };

    template<typename K, typename V, typename C, typename A>
    struct formatter<std::map<K, V, C, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return zerokit::format_sequence(ctx.out(), v, "{", "}", [](auto out_it, const auto &item) {
                return fmt::format_to(out_it, "{}: {}", item.first, item.second);
            });
        }
    };

    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "none");
        }
    };
}

#endif // !ZEROKIT_COMMON_FORMAT_HPP
