/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_TINY_STR_HPP
#define ZEROKIT_TINY_STR_HPP

#include <array>
#include <compare>
#include <cstring>
#include <string>
#include <string_view>
#include <zk/codec.hpp>

namespace zerokit {
    // An ASCII string of at most SZ bytes stored inline in exactly SZ bytes, padded with zeros.
    template<size_t SZ>
    struct tiny_str {
        static_assert(SZ > 0);
        using storage_type = std::array<uint8_t, SZ>;

        static tiny_str from_str(const std::string_view s)
        {
            if (s.size() > SZ) [[unlikely]]
                throw error(fmt::format("tiny_str<{}> cannot hold {} bytes: '{}'", SZ, s.size(), s));
            tiny_str res {};
            for (size_t i = 0; i < s.size(); ++i) {
                const auto c = static_cast<uint8_t>(s[i]);
                if (c == 0 || c >= 0x80) [[unlikely]]
                    throw error(fmt::format("tiny_str<{}> accepts only non-zero ASCII characters but got 0x{:02X} at position {}", SZ, c, i));
                res._bytes[i] = c;
            }
            return res;
        }

        // the input must satisfy is_valid
        static tiny_str from_storage(const storage_type &bytes) noexcept
        {
            tiny_str res {};
            res._bytes = bytes;
            return res;
        }

        static bool is_valid(const uint8_t *bytes) noexcept
        {
            size_t i = 0;
            for (; i < SZ && bytes[i] != 0; ++i) {
                if (bytes[i] >= 0x80)
                    return false;
            }
            for (; i < SZ; ++i) {
                if (bytes[i] != 0)
                    return false;
            }
            return true;
        }

        tiny_str() =default;

        size_t size() const noexcept
        {
            size_t sz = 0;
            while (sz < SZ && _bytes[sz] != 0)
                ++sz;
            return sz;
        }

        bool empty() const noexcept
        {
            return _bytes[0] == 0;
        }

        std::string_view str() const noexcept
        {
            return { reinterpret_cast<const char *>(_bytes.data()), size() };
        }

        const storage_type &storage() const noexcept
        {
            return _bytes;
        }

        bool operator==(const tiny_str &o) const noexcept =default;

        std::strong_ordering operator<=>(const tiny_str &o) const noexcept
        {
            // zero padding makes the byte-wise order equal to the lexicographic order of the strings
            const auto cmp = memcmp(_bytes.data(), o._bytes.data(), SZ);
            if (cmp < 0)
                return std::strong_ordering::less;
            if (cmp > 0)
                return std::strong_ordering::greater;
            return std::strong_ordering::equal;
        }
    private:
        storage_type _bytes {};
    };

    using tiny_str4 = tiny_str<4>;
    using tiny_str8 = tiny_str<8>;
    using tiny_str16 = tiny_str<16>;

    template<size_t SZ>
    struct codec<tiny_str<SZ>> {
        static constexpr size_t width = SZ;

        static void store(const tiny_str<SZ> &v, uint8_t *out) noexcept
        {
            memcpy(out, v.storage().data(), SZ);
        }

        static tiny_str<SZ> load(const uint8_t *in) noexcept
        {
            typename tiny_str<SZ>::storage_type bytes;
            memcpy(bytes.data(), in, SZ);
            return tiny_str<SZ>::from_storage(bytes);
        }

        static bool valid(const uint8_t *in) noexcept
        {
            return tiny_str<SZ>::is_valid(in);
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<zerokit::tiny_str<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.str());
        }
    };
}

#endif // !ZEROKIT_TINY_STR_HPP
