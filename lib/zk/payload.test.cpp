/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <zk/common/test.hpp>
#include <zk/payload.hpp>
#include <zk/zero-map.hpp>

using namespace zerokit;

namespace {
    using plural_map = zero_map<std::string_view, std::string_view>;

    shared_buffer make_plurals()
    {
        const std::map<std::string, std::string> src { { "one", "day" }, { "other", "days" } };
        return std::make_shared<const uint8_vector>(plural_map::from(src).bytes());
    }

    plural_map parse_plurals(const buffer b)
    {
        return plural_map::from_bytes(b);
    }

    template<typename F>
    data_error_kind caught_kind(const F &f)
    {
        try {
            f();
        } catch (const data_error &ex) {
            return ex.kind();
        }
        return data_error_kind::custom;
    }
}

suite payload_suite = [] {
    "payload"_test = [] {
        "from_owned"_test = [] {
            auto p = payload<std::string>::from_owned("hello");
            expect(!p.has_cart());
            test_same(std::string { "hello" }, p.get());
            test_same(std::string { "hello" }, std::move(p).try_unwrap_owned());
        };
        "from_shared_buffer"_test = [] {
            auto p = payload<plural_map>::from_shared_buffer(make_plurals(), parse_plurals);
            expect(p.has_cart());
            expect(p.get().get("other") == std::optional<std::string_view> { "days" });
            expect(caught_kind([&] { std::move(p).try_unwrap_owned(); }) == data_error_kind::invalid_state);
        };
        "malformed buffer"_test = [] {
            auto bytes = std::make_shared<const uint8_vector>(uint8_vector { 1, 2, 3 });
            expect(throws<length_mismatch_error>([&] { payload<plural_map>::from_shared_buffer(bytes, parse_plurals); }));
        };
        "from_static_buffer"_test = [] {
            static const std::array<uint8_t, 5> data { 'h', 'e', 'l', 'l', 'o' };
            auto p = payload<std::string_view>::from_static_buffer(buffer { data }, [](const buffer b) { return b.str(); });
            expect(!p.has_cart());
            test_same(std::string_view { "hello" }, p.get());
        };
        "map_project"_test = [] {
            auto p = payload<plural_map>::from_shared_buffer(make_plurals(), parse_plurals);
            const auto cart = p.as_yoke().backing_cart();
            auto one = std::move(p).map_project([](plural_map &&m) { return m.at("one"); });
            test_same(std::string_view { "day" }, one.get());
            expect(one.as_yoke().backing_cart() == cart);
            const auto cloned = one.map_project_cloned([](const std::string_view &s) { return s.size(); });
            test_same(size_t { 3 }, cloned.get());
        };
        "try_map_project"_test = [] {
            auto p = payload<plural_map>::from_shared_buffer(make_plurals(), parse_plurals);
            auto few = std::move(p).try_map_project([](plural_map &&m) { return m.get("few"); });
            expect(!few);
            auto p2 = payload<plural_map>::from_shared_buffer(make_plurals(), parse_plurals);
            auto other = std::move(p2).try_map_project([](plural_map &&m) { return m.get("other"); });
            expect(static_cast<bool>(other));
            if (other)
                test_same(std::string_view { "days" }, other->get());
        };
        "any_payload"_test = [] {
            const auto any = any_payload::from(payload<plural_map>::from_shared_buffer(make_plurals(), parse_plurals));
            expect(any.is<plural_map>());
            expect(!any.is<std::string>());
            expect(any.type_name().find("zero_map") != std::string::npos) << any.type_name();
            const auto p = any.downcast<plural_map>();
            test_same(size_t { 2 }, p.get().size());
            expect(caught_kind([&] { any.downcast<std::string>(); }) == data_error_kind::mismatched_type);
        };
        "data_response"_test = [] {
            data_response<std::string> empty {};
            expect(caught_kind([&] { std::move(empty).take_payload(); }) == data_error_kind::missing_payload);
            data_response<std::string> full { { "en" }, payload<std::string>::from_owned("x") };
            const auto p = std::move(full).take_payload();
            test_same(std::string { "x" }, p.get());
            expect(!full.payload);
            test_same(std::string { "missing_payload" }, fmt::format("{}", data_error_kind::missing_payload));
        };
    };
};
