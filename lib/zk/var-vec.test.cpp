/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <random>
#include <zk/common/test.hpp>
#include <zk/var-vec.hpp>

using namespace zerokit;

namespace {
    uint8_vector raw_var_vec(const std::initializer_list<uint32_t> header, const std::string_view data)
    {
        uint8_vector res {};
        for (const auto h: header)
            encode_to<uint32_t>(res, h);
        res << buffer { data };
        return res;
    }
}

suite var_vec_suite = [] {
    "var_vec"_test = [] {
        "offset table"_test = [] {
            const auto ok = raw_var_vec({ 3, 0, 5, 9, 9 }, "helloabcd");
            const auto v = var_vec<buffer>::from_bytes(ok);
            test_same(size_t { 3 }, v.size());
            test_same(std::string_view { "hello" }, v[0].str());
            test_same(std::string_view { "abcd" }, v[1].str());
            expect(v[2].empty());
            expect(throws<invalid_offset_table_error>([] { var_vec<buffer>::from_bytes(raw_var_vec({ 3, 0, 5, 3, 10 }, "helloabcde")); }));
            expect(throws<invalid_offset_table_error>([] { var_vec<buffer>::from_bytes(raw_var_vec({ 2, 1, 5, 9 }, "helloabcd")); }));
            expect(throws<invalid_offset_table_error>([] { var_vec<buffer>::from_bytes(raw_var_vec({ 2, 0, 5, 8 }, "helloabcd")); }));
            expect(throws<invalid_offset_table_error>([] { var_vec<buffer>::from_bytes(raw_var_vec({ 2, 0, 5, 10 }, "helloabcd")); }));
        };
        "header length"_test = [] {
            expect(throws<length_mismatch_error>([] { var_vec<buffer>::from_bytes(uint8_vector { 1, 0 }); }));
            expect(throws<length_mismatch_error>([] { var_vec<buffer>::from_bytes(raw_var_vec({ 5, 0, 1 }, "a")); }));
            expect(throws<length_mismatch_error>([] { var_vec<buffer>::from_bytes(raw_var_vec({ 0xFFFFFFFF }, "")); }));
            expect(throws<length_mismatch_error>([] { var_vec<buffer, uint16_t>::from_bytes(uint8_vector { 1 }); }));
        };
        "empty"_test = [] {
            const auto v = var_vec<std::string_view>::from_bytes(buffer {});
            expect(v.empty());
            expect(!v.get(0));
            expect(v.begin() == v.end());
            expect(var_vec<std::string_view>::from(std::vector<std::string> {}).bytes().empty());
            // an explicit zero count is a valid encoding of an empty sequence as well
            expect(var_vec<std::string_view>::from_bytes(raw_var_vec({ 0, 0 }, "")).empty());
        };
        "strings"_test = [] {
            const std::vector<std::string> src { "hello", "", "\xD0\xBC\xD0\xB8\xD1\x80", "world" };
            const auto owned = var_vec<std::string_view>::from(src);
            expect(owned.is_owned());
            const auto v = var_vec<std::string_view>::from_bytes(owned.bytes());
            expect(!v.is_owned());
            test_same(size_t { 4 }, v.size());
            test_same(std::string_view { "hello" }, v[0]);
            test_same(std::string_view { "" }, v.at(1));
            test_same(src, v.to_vector());
            expect(!v.get(4));
            expect(throws<index_out_of_range_error>([&] { v.at(4); }));
            expect(v.get_bytes(2) == std::optional<buffer> { buffer { std::string_view { "\xD0\xBC\xD0\xB8\xD1\x80" } } });
            test_same(std::string { "[hello, , \xD0\xBC\xD0\xB8\xD1\x80, world]" }, fmt::format("{}", v));
            expect(v == owned);
        };
        "byte layout"_test = [] {
            const auto v = var_vec<std::string_view>::from({ "ab", "c" });
            test_same(raw_var_vec({ 2, 0, 2, 3 }, "abc"), uint8_vector { v.bytes() });
            const auto v16 = var_vec<std::string_view, uint16_t>::from({ "ab", "c" });
            test_same(uint8_vector::from_hex("0200000002000300616263"), uint8_vector { v16.bytes() });
        };
        "utf8 validation"_test = [] {
            expect(throws<invalid_element_error>([] { var_vec<std::string_view>::from_bytes(raw_var_vec({ 1, 0, 1 }, "\xFF")); }));
            // an overlong encoding of '/'
            expect(throws<invalid_element_error>([] { var_vec<std::string_view>::from_bytes(raw_var_vec({ 1, 0, 2 }, "\xC0\xAF")); }));
            // a UTF-16 surrogate
            expect(throws<invalid_element_error>([] { var_vec<std::string_view>::from_bytes(raw_var_vec({ 1, 0, 3 }, "\xED\xA0\x80")); }));
            // a truncated sequence
            expect(throws<invalid_element_error>([] { var_vec<std::string_view>::from_bytes(raw_var_vec({ 1, 0, 2 }, "\xE2\x82")); }));
            expect(nothrow([] { var_vec<std::string_view>::from_bytes(raw_var_vec({ 1, 0, 4 }, "\xF0\x9F\x98\x80")); }));
            expect(nothrow([] { var_vec<buffer>::from_bytes(raw_var_vec({ 1, 0, 1 }, "\xFF")); }));
        };
        "narrow offsets"_test = [] {
            const std::vector<std::string> big { std::string(70000, 'x') };
            expect(throws<error>([&] { var_vec<std::string_view, uint16_t>::from(big); }));
            expect(nothrow([&] { var_vec<std::string_view, uint32_t>::from(big); }));
        };
        "nested fixed_vec"_test = [] {
            const std::vector<std::vector<uint32_t>> src { { 1, 2 }, {}, { 3 } };
            const auto owned = var_vec<fixed_vec<uint32_t>>::from(src);
            const auto v = var_vec<fixed_vec<uint32_t>>::from_bytes(owned.bytes());
            test_same(size_t { 3 }, v.size());
            test_same(uint32_t { 2 }, v[0][1]);
            expect(v[1].empty());
            test_same(src, v.to_vector());
            expect(v[0].bytes().data() >= v.bytes().data());
            // the nested element must be a whole number of u32 values
            expect(throws<length_mismatch_error>([] { var_vec<fixed_vec<uint32_t>>::from_bytes(raw_var_vec({ 1, 0, 3 }, "abc")); }));
        };
        "nested var_vec"_test = [] {
            const std::vector<std::vector<std::string>> src { { "a", "bc" }, { "def" }, {} };
            const auto v = var_vec<var_vec<std::string_view>>::from(src);
            test_same(size_t { 3 }, v.size());
            test_same(std::string_view { "bc" }, v[0][1]);
            test_same(std::string_view { "def" }, v[1].at(0));
            expect(v[2].empty());
            test_same(src, var_vec<var_vec<std::string_view>>::from_bytes(v.bytes()).to_vector());
            uint8_vector broken { v.bytes() };
            // corrupt the first offset of the first nested var_vec
            broken[5 * 4 + 4] = 1;
            expect(throws<invalid_offset_table_error>([&] { var_vec<var_vec<std::string_view>>::from_bytes(broken); }));
        };
        "binary_search"_test = [] {
            const auto v = var_vec<std::string_view>::from({ "apple", "banana", "cherry" });
            expect(v.binary_search("banana") == search_result { true, 1 });
            expect(v.binary_search("blueberry") == search_result { false, 2 });
            expect(v.contains("cherry"));
            expect(!v.contains("date"));
        };
        "iteration is restartable"_test = [] {
            const auto v = var_vec<std::string_view>::from({ "x", "yy", "zzz" });
            std::vector<std::string_view> first {}, second {};
            for (const auto s: v)
                first.emplace_back(s);
            for (const auto s: v)
                second.emplace_back(s);
            test_same(first, second);
            test_same(size_t { 3 }, first.size());
        };
        "to_owned"_test = [] {
            var_vec<std::string_view> copy {};
            {
                const uint8_vector bytes { var_vec<std::string_view>::from({ "a", "b" }).bytes() };
                copy = var_vec<std::string_view>::from_bytes(bytes).to_owned();
            }
            expect(copy.is_owned());
            test_same(std::vector<std::string> { "a", "b" }, copy.to_vector());
        };
        "random bytes"_test = [] {
            std::mt19937 rnd { 42 };
            std::uniform_int_distribution<int> len_dist { 0, 64 };
            std::uniform_int_distribution<int> byte_dist { 0, 255 };
            size_t accepted = 0;
            for (size_t i = 0; i < 20000; ++i) {
                uint8_vector bytes(len_dist(rnd));
                for (auto &b: bytes)
                    b = static_cast<uint8_t>(byte_dist(rnd));
                // small counts make a well-formed header likely enough to reach element validation
                if (bytes.size() >= 4 && (i % 2) == 0) {
                    bytes[0] = static_cast<uint8_t>(bytes[0] % 4);
                    bytes[1] = bytes[2] = bytes[3] = 0;
                }
                try {
                    const auto v = var_vec<std::string_view>::from_bytes(bytes);
                    for (const auto s: v)
                        expect(utf8_valid(buffer { s }));
                    ++accepted;
                } catch (const zero_copy_error &) {
                    // rejection with a typed error is the only other allowed outcome
                }
            }
            expect(accepted > size_t { 0 });
        };
    };
};
