/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_CODEC_HPP
#define ZEROKIT_CODEC_HPP

#include <array>
#include <bit>
#include <concepts>
#include <cstdint>
#include <tuple>
#include <type_traits>
#include <utility>
#include <zk/common/bytes.hpp>
#include <zk/zero-error.hpp>

/*
 * Byte-format codec: every fixed-width element type T has a specialization codec<T> with
 *   static constexpr size_t width;                   - the exact number of bytes of the encoding
 *   static void store(const T &, uint8_t *out);      - writes exactly width bytes
 *   static T load(const uint8_t *in);                - reads exactly width bytes
 * and, for types where not every byte pattern is a valid value,
 *   static bool valid(const uint8_t *in);
 * All multi-byte numbers are little-endian. Decoding never depends on the alignment of the input.
 */
namespace zerokit {
    template<typename T>
    struct codec;

    template<std::unsigned_integral U>
    constexpr U load_le(const uint8_t *in) noexcept
    {
        U v = 0;
        for (size_t i = 0; i < sizeof(U); ++i)
            v |= static_cast<U>(static_cast<U>(in[i]) << (8 * i));
        return v;
    }

    template<std::unsigned_integral U>
    constexpr void store_le(const U v, uint8_t *out) noexcept
    {
        for (size_t i = 0; i < sizeof(U); ++i)
            out[i] = static_cast<uint8_t>(v >> (8 * i));
    }

    template<typename T>
    concept fixed_encodable = requires(const T &v, uint8_t *out, const uint8_t *in) {
        { codec<T>::width } -> std::convertible_to<size_t>;
        { codec<T>::store(v, out) };
        { codec<T>::load(in) } -> std::same_as<T>;
    };

    template<typename T>
    concept validated_encodable = fixed_encodable<T> && requires(const uint8_t *in) {
        { codec<T>::valid(in) } -> std::convertible_to<bool>;
    };

    template<fixed_encodable T>
    constexpr size_t encoded_width = codec<T>::width;

    // true when the bytes starting at in hold a valid encoding of T
    template<fixed_encodable T>
    constexpr bool codec_valid(const uint8_t *in) noexcept
    {
        if constexpr (validated_encodable<T>)
            return codec<T>::valid(in);
        else
            return true;
    }

    template<typename T>
        requires std::integral<T> && (!std::same_as<T, bool>) && (!std::same_as<T, char32_t>)
    struct codec<T> {
        using unsigned_type = std::make_unsigned_t<T>;
        static constexpr size_t width = sizeof(T);

        static void store(const T &v, uint8_t *out) noexcept
        {
            store_le(static_cast<unsigned_type>(v), out);
        }

        static T load(const uint8_t *in) noexcept
        {
            return static_cast<T>(load_le<unsigned_type>(in));
        }
    };

    template<>
    struct codec<bool> {
        static constexpr size_t width = 1;

        static void store(const bool &v, uint8_t *out) noexcept
        {
            *out = v ? 1 : 0;
        }

        static bool load(const uint8_t *in) noexcept
        {
            return *in != 0;
        }

        static bool valid(const uint8_t *in) noexcept
        {
            return *in <= 1;
        }
    };

    // Unicode scalar values only: surrogates and values above U+10FFFF are rejected
    template<>
    struct codec<char32_t> {
        static constexpr size_t width = 4;

        static void store(const char32_t &v, uint8_t *out) noexcept
        {
            store_le(static_cast<uint32_t>(v), out);
        }

        static char32_t load(const uint8_t *in) noexcept
        {
            return static_cast<char32_t>(load_le<uint32_t>(in));
        }

        static bool valid(const uint8_t *in) noexcept
        {
            const auto cp = load_le<uint32_t>(in);
            return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
        }
    };

    template<std::floating_point T>
        requires (sizeof(T) == 4 || sizeof(T) == 8)
    struct codec<T> {
        using bits_type = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
        static constexpr size_t width = sizeof(T);

        static void store(const T &v, uint8_t *out) noexcept
        {
            store_le(std::bit_cast<bits_type>(v), out);
        }

        static T load(const uint8_t *in) noexcept
        {
            return std::bit_cast<T>(load_le<bits_type>(in));
        }
    };

    template<typename T>
        requires std::is_enum_v<T>
    struct codec<T> {
        using underlying_type = std::underlying_type_t<T>;
        static constexpr size_t width = codec<underlying_type>::width;

        static void store(const T &v, uint8_t *out) noexcept
        {
            codec<underlying_type>::store(static_cast<underlying_type>(v), out);
        }

        static T load(const uint8_t *in) noexcept
        {
            return static_cast<T>(codec<underlying_type>::load(in));
        }
    };

    template<fixed_encodable T, size_t SZ>
    struct codec<std::array<T, SZ>> {
        static constexpr size_t item_width = codec<T>::width;
        static constexpr size_t width = item_width * SZ;

        static void store(const std::array<T, SZ> &v, uint8_t *out)
        {
            for (size_t i = 0; i < SZ; ++i)
                codec<T>::store(v[i], out + i * item_width);
        }

        static std::array<T, SZ> load(const uint8_t *in)
        {
            std::array<T, SZ> res {};
            for (size_t i = 0; i < SZ; ++i)
                res[i] = codec<T>::load(in + i * item_width);
            return res;
        }

        static bool valid(const uint8_t *in) noexcept
        {
            for (size_t i = 0; i < SZ; ++i) {
                if (!codec_valid<T>(in + i * item_width))
                    return false;
            }
            return true;
        }
    };

    // Encodes a fixed list of components back to back in their declaration order.
    // Used by std::pair, std::tuple, and user structures through codec_fields.
    template<fixed_encodable... Ts>
    struct codec_sequence {
        static constexpr size_t width = (codec<Ts>::width + ... + 0);

        static constexpr std::array<size_t, sizeof...(Ts)> offsets()
        {
            std::array<size_t, sizeof...(Ts)> res {};
            size_t off = 0;
            size_t i = 0;
            ((res[i++] = off, off += codec<Ts>::width), ...);
            return res;
        }

        static bool valid(const uint8_t *in) noexcept
        {
            return _valid(in, std::index_sequence_for<Ts...> {});
        }
    private:
        template<size_t ...Is>
        static bool _valid(const uint8_t *in, std::index_sequence<Is...>) noexcept
        {
            constexpr auto offs = offsets();
            return (codec_valid<Ts>(in + offs[Is]) && ...);
        }
    };

    template<fixed_encodable A, fixed_encodable B>
    struct codec<std::pair<A, B>>: codec_sequence<A, B> {
        using base_type = codec_sequence<A, B>;

        static void store(const std::pair<A, B> &v, uint8_t *out)
        {
            codec<A>::store(v.first, out);
            codec<B>::store(v.second, out + codec<A>::width);
        }

        static std::pair<A, B> load(const uint8_t *in)
        {
            return { codec<A>::load(in), codec<B>::load(in + codec<A>::width) };
        }
    };

    template<fixed_encodable... Ts>
    struct codec<std::tuple<Ts...>>: codec_sequence<Ts...> {
        using base_type = codec_sequence<Ts...>;

        static void store(const std::tuple<Ts...> &v, uint8_t *out)
        {
            _store(v, out, std::index_sequence_for<Ts...> {});
        }

        static std::tuple<Ts...> load(const uint8_t *in)
        {
            return _load(in, std::index_sequence_for<Ts...> {});
        }
    private:
        template<size_t ...Is>
        static void _store(const std::tuple<Ts...> &v, uint8_t *out, std::index_sequence<Is...>)
        {
            constexpr auto offs = base_type::offsets();
            (codec<Ts>::store(std::get<Is>(v), out + offs[Is]), ...);
        }

        template<size_t ...Is>
        static std::tuple<Ts...> _load(const uint8_t *in, std::index_sequence<Is...>)
        {
            constexpr auto offs = base_type::offsets();
            return { codec<Ts>::load(in + offs[Is])... };
        }
    };

    template<auto M>
    struct member_pointer_traits;

    template<typename S, typename F, F S::*M>
    struct member_pointer_traits<M> {
        using struct_type = S;
        using field_type = F;
    };

    // Codec for a user structure: fields are encoded in the order of the listed member pointers.
    // Example: template<> struct codec<date>: codec_fields<date, &date::year, &date::month, &date::day> {};
    template<typename S, auto ...Fields>
    struct codec_fields: codec_sequence<typename member_pointer_traits<Fields>::field_type...> {
        using base_type = codec_sequence<typename member_pointer_traits<Fields>::field_type...>;
        static_assert((std::is_same_v<typename member_pointer_traits<Fields>::struct_type, S> && ...));
        static_assert(std::is_default_constructible_v<S>);

        static void store(const S &v, uint8_t *out)
        {
            _store(v, out, std::make_index_sequence<sizeof...(Fields)> {});
        }

        static S load(const uint8_t *in)
        {
            S res {};
            _load(res, in, std::make_index_sequence<sizeof...(Fields)> {});
            return res;
        }
    private:
        template<size_t ...Is>
        static void _store(const S &v, uint8_t *out, std::index_sequence<Is...>)
        {
            constexpr auto offs = base_type::offsets();
            (codec<typename member_pointer_traits<Fields>::field_type>::store(v.*Fields, out + offs[Is]), ...);
        }

        template<size_t ...Is>
        static void _load(S &res, const uint8_t *in, std::index_sequence<Is...>)
        {
            constexpr auto offs = base_type::offsets();
            ((res.*Fields = codec<typename member_pointer_traits<Fields>::field_type>::load(in + offs[Is])), ...);
        }
    };

    template<fixed_encodable T>
    std::array<uint8_t, codec<T>::width> encode(const T &v)
    {
        std::array<uint8_t, codec<T>::width> res {};
        codec<T>::store(v, res.data());
        return res;
    }

    template<fixed_encodable T>
    void encode_to(uint8_vector &out, const T &v)
    {
        const auto off = out.size();
        out.resize(off + codec<T>::width);
        codec<T>::store(v, out.data() + off);
    }

    // Returns the number of elements of the given width in bytes
    inline size_t validate_length(const buffer bytes, const size_t width)
    {
        if (width == 0) [[unlikely]]
            throw error("the element width must be positive");
        if (bytes.size() % width != 0) [[unlikely]]
            throw length_mismatch_error(fmt::format("byte length {} is not a multiple of the element width {}", bytes.size(), width));
        return bytes.size() / width;
    }

    template<fixed_encodable T>
    size_t validate_length(const buffer bytes)
    {
        return validate_length(bytes, codec<T>::width);
    }

    // Checks the length and every element's encoding; returns the number of elements
    template<fixed_encodable T>
    size_t validate(const buffer bytes)
    {
        const auto cnt = validate_length<T>(bytes);
        if constexpr (validated_encodable<T>) {
            for (size_t i = 0; i < cnt; ++i) {
                if (!codec<T>::valid(bytes.data() + i * codec<T>::width)) [[unlikely]]
                    throw invalid_element_error(fmt::format("element #{} is not a valid encoding: {}", i, bytes.subbuf(i * codec<T>::width, codec<T>::width)));
            }
        }
        return cnt;
    }

    template<fixed_encodable T>
    T decode(const buffer bytes)
    {
        if (bytes.size() != codec<T>::width) [[unlikely]]
            throw length_mismatch_error(fmt::format("expected {} bytes but got {}", codec<T>::width, bytes.size()));
        if (!codec_valid<T>(bytes.data())) [[unlikely]]
            throw invalid_element_error(fmt::format("not a valid encoding: {}", bytes));
        return codec<T>::load(bytes.data());
    }
}

#endif // !ZEROKIT_CODEC_HPP
