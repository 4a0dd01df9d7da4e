/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_COMMON_BYTES_HPP
#define ZEROKIT_COMMON_BYTES_HPP

#include <algorithm>
#include <array>
#include <compare>
#include <cstring>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "error.hpp"
#include "format.hpp"

namespace zerokit {
    /*
     * A non-owning view of bytes. All zero-copy containers are built on top of it,
     * so every slicing operation is bounds-checked and reports a failure with an exception.
     */
    struct buffer: std::span<const uint8_t> {
        buffer() =default;
        buffer(const buffer &) =default;

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        template <typename T, size_t SZ>
        buffer(const std::span<T, SZ> items):
            buffer { reinterpret_cast<const uint8_t *>(items.data()), items.size_bytes() }
        {
        }

        template<size_t SZ>
        buffer(const std::array<uint8_t, SZ> &bytes):
            buffer { bytes.data(), SZ }
        {
        }

        buffer(const std::string_view s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer(const std::string &s):
            buffer { std::string_view { s } }
        {
        }

        buffer &operator=(const buffer &o) =default;

        std::string_view str() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        // byte-wise lexicographic order, a shorter prefix goes first
        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            return std::lexicographical_compare_three_way(begin(), end(), o.begin(), o.end());
        }

        bool operator==(const buffer &o) const noexcept
        {
            return size() == o.size() && (empty() || memcmp(data(), o.data(), size()) == 0);
        }

        // true when o occupies a subrange of this buffer's memory; an empty view is contained anywhere
        bool contains(const buffer &o) const noexcept
        {
            if (o.empty())
                return true;
            const std::less_equal<const uint8_t *> le {};
            return le(data(), o.data()) && le(o.data() + o.size(), data() + size());
        }

        buffer subbuf(const size_t offset, const size_t sz) const
        {
            if (offset > size() || sz > size() - offset) [[unlikely]]
                throw error(fmt::format("a slice at offset {} of {} bytes does not fit into {} bytes", offset, sz, size()));
            return buffer { data() + offset, sz };
        }

        buffer subbuf(const size_t offset) const
        {
            if (offset > size()) [[unlikely]]
                throw error(fmt::format("offset {} is past the end of {} bytes", offset, size()));
            return buffer { data() + offset, size() - offset };
        }

        // the first offset bytes and the rest
        std::pair<buffer, buffer> split_at(const size_t offset) const
        {
            return { subbuf(0, offset), subbuf(offset) };
        }
    };

    struct uint8_vector: std::vector<uint8_t> {
        // Test vectors and diagnostics are written in hex. Throws error on odd lengths and non-hex characters.
        static uint8_vector from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0) [[unlikely]]
                throw error(fmt::format("a hex string must have an even number of characters but has {}", hex.size()));
            const auto nibble = [hex](const char c) -> uint8_t {
                if (c >= '0' && c <= '9')
                    return c - '0';
                if (c >= 'a' && c <= 'f')
                    return c - 'a' + 10;
                if (c >= 'A' && c <= 'F')
                    return c - 'A' + 10;
                throw error(fmt::format("unexpected character '{}' in hex string {}", c, hex));
            };
            uint8_vector res(hex.size() / 2);
            for (size_t i = 0; i < res.size(); ++i)
                res[i] = (nibble(hex[i * 2]) << 4) | nibble(hex[i * 2 + 1]);
            return res;
        }

        uint8_vector() =default;

        explicit uint8_vector(const size_t sz):
            std::vector<uint8_t>(sz)
        {
        }

        uint8_vector(const std::initializer_list<uint8_t> bytes):
            std::vector<uint8_t> { bytes }
        {
        }

        uint8_vector(const buffer bytes):
            std::vector<uint8_t> { bytes.begin(), bytes.end() }
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        std::string_view str() const noexcept
        {
            return static_cast<buffer>(*this).str();
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            return static_cast<buffer>(*this) <=> o;
        }

        std::strong_ordering operator<=>(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) <=> static_cast<buffer>(o);
        }

        bool operator==(const buffer &o) const noexcept
        {
            return static_cast<buffer>(*this) == o;
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) == static_cast<buffer>(o);
        }
    };

    static_assert(std::is_convertible_v<uint8_vector, buffer>);

    inline uint8_vector &operator<<(uint8_vector &v, const uint8_t b)
    {
        v.push_back(b);
        return v;
    }

    inline uint8_vector &operator<<(uint8_vector &v, const buffer bytes)
    {
        v.insert(v.end(), bytes.begin(), bytes.end());
        return v;
    }
}

namespace fmt {
    template<>
    struct formatter<zerokit::buffer>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<zerokit::uint8_vector>: formatter<zerokit::buffer> {
    };
}

#endif // !ZEROKIT_COMMON_BYTES_HPP
