/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <random>
#include <zk/common/test.hpp>
#include <zk/tiny-str.hpp>
#include <zk/zero-map.hpp>

using namespace zerokit;

suite zero_map_suite = [] {
    "zero_map"_test = [] {
        "unordered items are sorted"_test = [] {
            const auto m = zero_map<std::string_view, uint32_t>::from({ { "a", 1 }, { "c", 3 }, { "b", 2 } });
            test_same(size_t { 3 }, m.size());
            test_same(std::vector<std::string> { "a", "b", "c" }, m.keys().to_vector());
            test_same(std::vector<uint32_t> { 1, 2, 3 }, m.values().to_vector());
            expect(m.get("b") == std::optional<uint32_t> { 2 });
            expect(!m.get("z"));
            test_same(std::string { "{a: 1, b: 2, c: 3}" }, fmt::format("{}", m));
        };
        "duplicate keys"_test = [] {
            expect(throws<duplicate_key_error>([] { zero_map<std::string_view, uint32_t>::from({ { "a", 1 }, { "a", 2 } }); }));
            zero_map_builder<uint32_t, std::string_view> b {};
            b.insert(7, "seven");
            expect(b.contains(7));
            expect(throws<duplicate_key_error>([&] { b.insert(7, "another seven"); }));
            test_same(size_t { 1 }, b.size());
            b.insert(3, "three");
            expect(b.find_index(3) == std::optional<size_t> { 0 });
            expect(b.find_index(7) == std::optional<size_t> { 1 });
            expect(!b.find_index(5));
            const auto m = b.freeze();
            test_same(std::string_view { "seven" }, m.at(7));
            expect(m.find_index(7) == b.find_index(7));
        };
        "from ordered map"_test = [] {
            const std::map<uint32_t, std::string> src { { 10, "ten" }, { 20, "twenty" }, { 30, "thirty" }, { 40, "" } };
            const auto owned = zero_map<uint32_t, std::string_view>::from(src);
            expect(owned.is_owned());
            const auto m = zero_map<uint32_t, std::string_view>::from_bytes(owned.bytes());
            expect(!m.is_owned());
            expect(m == owned);
            test_same(src, m.to_map());
            expect(m.contains(20));
            expect(!m.contains(25));
            expect(m.find_index(30) == std::optional<size_t> { 2 });
            expect(!m.find_index(5));
            test_same(std::string_view { "twenty" }, m.at(20));
            expect(m.get(40) == std::optional<std::string_view> { "" });
            expect(throws<error>([&] { m.at(25); }));
            expect(m.get_by_index(1) == std::optional<std::pair<uint32_t, std::string_view>> { { 20, "twenty" } });
            expect(!m.get_by_index(4));
        };
        "from a map with another order"_test = [] {
            const std::map<std::string, uint32_t, std::greater<>> desc { { "a", 1 }, { "b", 2 }, { "c", 3 } };
            const auto m = zero_map<std::string_view, uint32_t>::from(desc);
            expect(m.get("a") == std::optional<uint32_t> { 1 });
            expect(m.get("b") == std::optional<uint32_t> { 2 });
            expect(m.get("c") == std::optional<uint32_t> { 3 });
            test_same(std::vector<std::string> { "a", "b", "c" }, m.keys().to_vector());
            const auto asc = zero_map<std::string_view, uint32_t>::from(std::map<std::string, uint32_t> { { "a", 1 }, { "b", 2 }, { "c", 3 } });
            test_same(uint8_vector { asc.bytes() }, uint8_vector { m.bytes() });
            expect(zero_map<std::string_view, uint32_t>::from_bytes(m.bytes()) == m);
            uint8_vector nested {};
            var_codec<zero_map<std::string_view, uint32_t>>::encode(nested, desc);
            test_same(uint8_vector { asc.bytes() }, nested);
        };
        "from a map with wider keys"_test = [] {
            const auto m = zero_map<uint32_t, uint8_t>::from(std::map<int, int> { { 5, 2 }, { 1, 200 } });
            test_same(std::vector<uint32_t> { 1, 5 }, m.keys().to_vector());
            expect(m.get(1) == std::optional<uint8_t> { 200 });
            expect(zero_map<uint32_t, uint8_t>::from_bytes(m.bytes()) == m);
            expect(throws<error>([] { zero_map<uint32_t, uint32_t>::from(std::map<int, int> { { -1, 1 }, { 5, 2 } }); }));
            expect(throws<error>([] { zero_map<uint32_t, uint8_t>::from(std::map<int, int> { { 1, 300 } }); }));
            expect(throws<error>([] { zero_map<uint8_t, uint8_t>::from(std::map<uint32_t, uint8_t> { { 1, 1 }, { 0x101, 2 } }); }));
        };
        "iteration"_test = [] {
            const std::map<uint32_t, std::string> src { { 3, "c" }, { 1, "a" }, { 2, "b" } };
            const auto m = zero_map<uint32_t, std::string_view>::from(src);
            std::vector<uint32_t> keys {};
            std::string values {};
            for (const auto &[k, v]: m) {
                keys.emplace_back(k);
                values += v;
            }
            test_same(std::vector<uint32_t> { 1, 2, 3 }, keys);
            test_same(std::string { "abc" }, values);
            std::string again {};
            for (const auto &[k, v]: m)
                again += v;
            test_same(values, again);
        };
        "range"_test = [] {
            const std::map<uint32_t, uint32_t> src { { 1, 10 }, { 3, 30 }, { 5, 50 }, { 7, 70 } };
            const auto m = zero_map<uint32_t, uint32_t>::from(src);
            std::vector<uint32_t> vals {};
            for (const auto &[k, v]: m.range(2, 7))
                vals.emplace_back(v);
            test_same(std::vector<uint32_t> { 30, 50 }, vals);
            expect(m.range(8, 100).empty());
            expect(m.range(5, 1).empty());
            test_same(size_t { 4 }, static_cast<size_t>(m.range(0, 8).size()));
        };
        "byte layout"_test = [] {
            const std::map<uint16_t, uint8_t> src { { 1, 0xAA }, { 2, 0xBB } };
            const auto m = zero_map<uint16_t, uint8_t>::from(src);
            test_same(uint8_vector::from_hex("0400000001000200AABB"), uint8_vector { m.bytes() });
            expect(zero_map<uint16_t, uint8_t>::from(std::map<uint16_t, uint8_t> {}).bytes().empty());
            expect(zero_map<uint16_t, uint8_t>::from_bytes(buffer {}).empty());
        };
        "malformed bytes"_test = [] {
            expect(throws<length_mismatch_error>([] { zero_map<uint16_t, uint8_t>::from_bytes(uint8_vector { 4, 0, 0 }); }));
            expect(throws<length_mismatch_error>([] { zero_map<uint16_t, uint8_t>::from_bytes(uint8_vector::from_hex("0500000001000200AA")); }));
            // two keys with three values
            expect(throws<length_mismatch_error>([] { zero_map<uint16_t, uint8_t>::from_bytes(uint8_vector::from_hex("0400000001000200AABBCC")); }));
            // an odd-sized key region
            expect(throws<length_mismatch_error>([] { zero_map<uint16_t, uint8_t>::from_bytes(uint8_vector::from_hex("03000000010002AABB")); }));
            uint8_vector unsorted {};
            zero_map<uint32_t, uint32_t>::write(unsorted, std::vector<uint32_t> { 2, 1 }, std::vector<uint32_t> { 20, 10 });
            expect(throws<unsorted_keys_error>([&] { zero_map<uint32_t, uint32_t>::from_bytes(unsorted); }));
            uint8_vector repeated {};
            zero_map<uint32_t, uint32_t>::write(repeated, std::vector<uint32_t> { 1, 1 }, std::vector<uint32_t> { 10, 10 });
            expect(throws<unsorted_keys_error>([&] { zero_map<uint32_t, uint32_t>::from_bytes(repeated); }));
            uint8_vector bad_value {};
            zero_map<uint32_t, std::string_view>::write(bad_value, std::vector<uint32_t> { 1 }, std::vector<std::string> { "\xFF" });
            expect(throws<invalid_element_error>([&] { zero_map<uint32_t, std::string_view>::from_bytes(bad_value); }));
        };
        "string keys"_test = [] {
            const std::map<std::string, uint8_t> src { { "zeta", 6 }, { "alpha", 1 }, { "Beta", 2 }, { "\xD0\xB0", 7 } };
            const auto m = zero_map<std::string_view, uint8_t>::from_bytes(zero_map<std::string_view, uint8_t>::from(src).bytes());
            test_same(src.size(), m.size());
            for (const auto &[k, v]: src)
                expect(m.get(k) == std::optional<uint8_t> { v }) << k;
            expect(!m.get("beta"));
        };
        "tiny_str keys"_test = [] {
            zero_map_builder<tiny_str8, fixed_vec<char32_t>> b {};
            b.insert(tiny_str8::from_str("ru"), std::vector<char32_t> { U'а', U'б' });
            b.insert(tiny_str8::from_str("en"), std::vector<char32_t> { U'a', U'b', U'c' });
            const auto m = zero_map<tiny_str8, fixed_vec<char32_t>>::from_bytes(b.freeze().bytes());
            const auto ru = m.get(tiny_str8::from_str("ru"));
            expect(static_cast<bool>(ru));
            if (ru)
                expect(ru->at(1) == U'б');
            test_same(size_t { 3 }, m.at(tiny_str8::from_str("en")).size());
        };
        "nested maps"_test = [] {
            const std::map<std::string, std::map<std::string, uint32_t>> src {
                { "en", { { "one", 1 }, { "two", 2 } } },
                { "de", { { "eins", 1 }, { "zwei", 2 }, { "drei", 3 } } },
                { "xx", {} }
            };
            using inner_map = zero_map<std::string_view, uint32_t>;
            using outer_map = zero_map<std::string_view, inner_map>;
            const auto owned = outer_map::from(src);
            const auto m = outer_map::from_bytes(owned.bytes());
            test_same(size_t { 3 }, m.size());
            const auto de = m.get("de");
            expect(static_cast<bool>(de));
            if (de) {
                expect(de->get("drei") == std::optional<uint32_t> { 3 });
                expect(!de->get("vier"));
            }
            expect(m.at("xx").empty());
            expect(m.at("en").get("two") == std::optional<uint32_t> { 2 });
            test_same(src, m.to_map());
            // the inner maps are views into the outer buffer
            expect(owned.bytes().contains(owned.at("de").bytes()));
        };
        "map values in var_vec"_test = [] {
            using small_map = zero_map<uint16_t, uint16_t>;
            const std::vector<std::map<uint16_t, uint16_t>> src { { { 1, 2 } }, {}, { { 3, 4 }, { 5, 6 } } };
            const auto v = var_vec<small_map>::from_bytes(var_vec<small_map>::from(src).bytes());
            test_same(size_t { 3 }, v.size());
            expect(v[2].get(5) == std::optional<uint16_t> { 6 });
            expect(v[1].empty());
        };
        "random bytes"_test = [] {
            std::mt19937 rnd { 7 };
            std::uniform_int_distribution<int> len_dist { 0, 48 };
            std::uniform_int_distribution<int> byte_dist { 0, 255 };
            size_t accepted = 0;
            for (size_t i = 0; i < 20000; ++i) {
                uint8_vector bytes(len_dist(rnd));
                for (auto &b: bytes)
                    b = static_cast<uint8_t>(byte_dist(rnd));
                if (bytes.size() >= 4 && (i % 2) == 0) {
                    bytes[0] = static_cast<uint8_t>((bytes[0] % 5) * 2);
                    bytes[1] = bytes[2] = bytes[3] = 0;
                }
                try {
                    const auto m = zero_map<uint16_t, uint8_t>::from_bytes(bytes);
                    for (size_t j = 1; j < m.size(); ++j)
                        expect(m.keys()[j - 1] < m.keys()[j]);
                    for (const auto &[k, v]: m)
                        expect(m.get(k) == std::optional<uint8_t> { v });
                    ++accepted;
                } catch (const zero_copy_error &) {
                    // rejection with a typed error is the only other allowed outcome
                }
            }
            expect(accepted > size_t { 0 });
        };
    };
};
