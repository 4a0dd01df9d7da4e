/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_NARROW_CAST_HPP
#define ZEROKIT_NARROW_CAST_HPP

#include <concepts>
#include <limits>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <zk/common/error.hpp>
#include <zk/common/format.hpp>

namespace zerokit {
    template<typename TO, typename FROM>
    constexpr TO narrow_cast(const FROM from)
    {
        if constexpr (std::numeric_limits<FROM>::is_signed == std::numeric_limits<TO>::is_signed) {
            if (from > std::numeric_limits<TO>::max()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
            if (from < std::numeric_limits<TO>::min()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too small", typeid(FROM).name(), from, typeid(TO).name()));
            return static_cast<TO>(from);
        } else if constexpr (std::numeric_limits<FROM>::is_signed) {
            if (from < 0) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is negative", typeid(FROM).name(), from, typeid(TO).name()));
            if (static_cast<std::make_unsigned_t<FROM>>(from) > std::numeric_limits<TO>::max()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
            return static_cast<TO>(from);
        } else {
            if (from > static_cast<std::make_unsigned_t<TO>>(std::numeric_limits<TO>::max())) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
            return static_cast<TO>(from);
        }
    }

    // integers other than bool and the character types
    template<typename T>
    concept plain_integer = std::integral<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>
        && !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char8_t> && !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>;

    // Converts an element to the stored type: integers through narrow_cast, everything else with a plain conversion.
    template<typename TO, typename FROM>
    constexpr TO checked_cast(FROM &&from)
    {
        using from_type = std::remove_cvref_t<FROM>;
        if constexpr (plain_integer<TO> && plain_integer<from_type> && !std::is_same_v<TO, from_type>)
            return narrow_cast<TO>(from);
        else
            return static_cast<TO>(std::forward<FROM>(from));
    }
}

#endif // !ZEROKIT_NARROW_CAST_HPP
