/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_COMMON_TEST_HPP
#define ZEROKIT_COMMON_TEST_HPP

#include <concepts>
#include <iostream>
#include <source_location>
#include <string>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"
#include "format.hpp"

namespace zerokit {
    using namespace boost::ut;

    // prints byte views as hex instead of the default element-wise output
    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer &operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>)
                std::cerr << fmt::format("{}", buffer { std::span<const uint8_t> { t } });
            else
                std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer &operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T>
    bool test_same(const T &expected, const T &actual, const std::source_location &loc=std::source_location::current())
    {
        const auto res = expected == actual;
        expect(res, loc) << fmt::format("expected {} but got {}", expected, actual);
        return res;
    }

    template<typename X, typename Y>
        requires (!std::same_as<X, Y>) && std::convertible_to<Y, X>
    bool test_same(const X &expected, const Y &actual, const std::source_location &loc=std::source_location::current())
    {
        return test_same<X>(expected, static_cast<X>(actual), loc);
    }

    template<typename T, typename Y>
    bool test_same(const std::string &name, const T &expected, const Y &actual, const std::source_location &loc=std::source_location::current())
    {
        const auto res = expected == static_cast<T>(actual);
        expect(res, loc) << fmt::format("{}: expected {} but got {}", name, expected, actual);
        return res;
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<zerokit::test_printer>> {};

#endif // !ZEROKIT_COMMON_TEST_HPP
