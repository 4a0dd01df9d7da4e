/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_VAR_VEC_HPP
#define ZEROKIT_VAR_VEC_HPP

#include <initializer_list>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>
#include <zk/fixed-vec.hpp>
#include <zk/narrow-cast.hpp>

namespace zerokit {
    /*
     * var_codec<E> describes how a variable-length element is stored inside a var_vec or a zero_map:
     *   using owned_type = ...;                          - an independently owned copy of an element
     *   static void validate(buffer);                    - throws a zero_copy_error for malformed bytes
     *   static E view(buffer) noexcept;                  - only for bytes that passed validate
     *   static owned_type to_owned(const E &);
     *   static void encode(uint8_vector &out, ...);      - appends the element's bytes
     */
    template<typename E>
    concept var_encodable = requires(const buffer bytes, const E &v, uint8_vector &out) {
        typename var_codec<E>::owned_type;
        { var_codec<E>::validate(bytes) };
        { var_codec<E>::view(bytes) } -> std::same_as<E>;
        { var_codec<E>::to_owned(v) } -> std::convertible_to<typename var_codec<E>::owned_type>;
        { var_codec<E>::encode(out, v) };
    };

    template<typename E, typename X>
    concept var_encodable_from = requires(uint8_vector &out, const X &x) {
        { var_codec<E>::encode(out, x) };
    };

    inline bool utf8_valid(const buffer bytes) noexcept
    {
        const uint8_t *p = bytes.data();
        const uint8_t *end = p + bytes.size();
        while (p < end) {
            const uint8_t c = *p;
            if (c < 0x80) {
                ++p;
                continue;
            }
            size_t len;
            uint32_t cp;
            if ((c & 0xE0) == 0xC0) {
                len = 2;
                cp = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                len = 3;
                cp = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                len = 4;
                cp = c & 0x07;
            } else {
                return false;
            }
            if (static_cast<size_t>(end - p) < len)
                return false;
            for (size_t i = 1; i < len; ++i) {
                if ((p[i] & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (p[i] & 0x3F);
            }
            // overlong encodings, surrogates, and values above the Unicode range
            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
                return false;
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                return false;
            p += len;
        }
        return true;
    }

    template<>
    struct var_codec<std::string_view> {
        using owned_type = std::string;

        static void validate(const buffer bytes)
        {
            if (!utf8_valid(bytes)) [[unlikely]]
                throw invalid_element_error(fmt::format("not a valid UTF-8 string: {}", bytes));
        }

        static std::string_view view(const buffer bytes) noexcept
        {
            return bytes.str();
        }

        static owned_type to_owned(const std::string_view v)
        {
            return owned_type { v };
        }

        static void encode(uint8_vector &out, const std::string_view v)
        {
            out << buffer { v };
        }
    };

    template<>
    struct var_codec<buffer> {
        using owned_type = uint8_vector;

        static void validate(const buffer) noexcept
        {
        }

        static buffer view(const buffer bytes) noexcept
        {
            return bytes;
        }

        static owned_type to_owned(const buffer v)
        {
            return owned_type { v };
        }

        static void encode(uint8_vector &out, const buffer v)
        {
            out << v;
        }
    };

    template<fixed_encodable T>
    struct var_codec<fixed_vec<T>> {
        using owned_type = std::vector<T>;

        static void validate(const buffer bytes)
        {
            zerokit::validate<T>(bytes);
        }

        static fixed_vec<T> view(const buffer bytes) noexcept
        {
            return fixed_vec<T>::_from_validated(bytes);
        }

        static owned_type to_owned(const fixed_vec<T> &v)
        {
            return v.to_vector();
        }

        static void encode(uint8_vector &out, const fixed_vec<T> &v)
        {
            out << v.bytes();
        }

        template<std::ranges::input_range R>
            requires std::convertible_to<std::ranges::range_reference_t<const R>, T>
        static void encode(uint8_vector &out, const R &items)
        {
            for (auto &&v: items)
                encode_to<T>(out, checked_cast<T>(v));
        }
    };

    /*
     * A sequence of variable-length elements over a byte slice. Layout, all numbers little-endian of type O:
     *   count, offsets[0] .. offsets[count], element bytes
     * with offsets[0] == 0, non-decreasing offsets, and offsets[count] equal to the size of the element bytes.
     * An empty byte slice is the empty var_vec. The whole layout including every element is validated
     * by from_bytes, so element access afterwards never fails.
     */
    template<var_encodable E, std::unsigned_integral O=uint32_t>
        requires (sizeof(O) == 2 || sizeof(O) == 4)
    struct var_vec {
        using value_type = E;
        using owned_type = typename var_codec<E>::owned_type;
        using offset_type = O;
        using const_iterator = indexed_iterator<var_vec, E>;
        using iterator = const_iterator;
        static constexpr size_t offset_width = sizeof(O);

        static var_vec from_bytes(const buffer bytes)
        {
            if (bytes.empty())
                return {};
            var_vec res = _parse_header(bytes);
            const auto cnt = res.size();
            if (res._offsets.item(0) != 0) [[unlikely]]
                throw invalid_offset_table_error(fmt::format("the first offset must be 0 but got {}", res._offsets.item(0)));
            for (size_t i = 0; i < cnt; ++i) {
                if (res._offsets.item(i) > res._offsets.item(i + 1)) [[unlikely]]
                    throw invalid_offset_table_error(fmt::format("offset #{}: {} is greater than the next offset: {}", i, res._offsets.item(i), res._offsets.item(i + 1)));
            }
            if (res._offsets.item(cnt) != res._data.size()) [[unlikely]]
                throw invalid_offset_table_error(fmt::format("the last offset {} does not match the data size {}", res._offsets.item(cnt), res._data.size()));
            for (size_t i = 0; i < cnt; ++i)
                var_codec<E>::validate(res._element_bytes(i));
            return res;
        }

        // Appends the encoding of items to out. An empty sequence produces no bytes.
        template<std::ranges::input_range R>
            requires var_encodable_from<E, std::ranges::range_value_t<R>>
        static void write(uint8_vector &out, const R &items)
        {
            uint8_vector data {};
            std::vector<size_t> offsets {};
            offsets.emplace_back(0);
            for (auto &&v: items) {
                var_codec<E>::encode(data, v);
                offsets.emplace_back(data.size());
            }
            const size_t cnt = offsets.size() - 1;
            if (cnt == 0)
                return;
            out.reserve(out.size() + (offsets.size() + 1) * offset_width + data.size());
            encode_to<O>(out, narrow_cast<O>(cnt));
            for (const auto off: offsets)
                encode_to<O>(out, narrow_cast<O>(off));
            out << static_cast<buffer>(data);
        }

        template<std::ranges::input_range R>
            requires var_encodable_from<E, std::ranges::range_value_t<R>>
        static var_vec from(const R &items)
        {
            auto data = std::make_shared<uint8_vector>();
            write(*data, items);
            return _from_owner(std::move(data));
        }

        static var_vec from(const std::initializer_list<E> items)
        {
            return from<std::initializer_list<E>>(items);
        }

        var_vec() =default;

        size_t size() const noexcept
        {
            return _offsets.empty() ? 0 : _offsets.size() - 1;
        }

        bool empty() const noexcept
        {
            return size() == 0;
        }

        buffer bytes() const noexcept
        {
            return _bytes;
        }

        // the concatenated bytes of all elements
        buffer data_bytes() const noexcept
        {
            return _data;
        }

        bool is_owned() const noexcept
        {
            return static_cast<bool>(_owner);
        }

        // idx must be less than size()
        E item(const size_t idx) const noexcept
        {
            return var_codec<E>::view(_element_bytes(idx));
        }

        E operator[](const size_t idx) const noexcept
        {
            return item(idx);
        }

        std::optional<E> get(const size_t idx) const noexcept
        {
            if (idx < size()) [[likely]]
                return item(idx);
            return {};
        }

        E at(const size_t idx) const
        {
            if (idx < size()) [[likely]]
                return item(idx);
            throw index_out_of_range_error(fmt::format("var_vec index out of range: {} >= {}", idx, size()));
        }

        // The raw bytes of an element; empty when idx is out of range
        std::optional<buffer> get_bytes(const size_t idx) const noexcept
        {
            if (idx < size()) [[likely]]
                return _element_bytes(idx);
            return {};
        }

        std::optional<E> first() const noexcept
        {
            return get(0);
        }

        std::optional<E> last() const noexcept
        {
            if (empty())
                return {};
            return item(size() - 1);
        }

        const_iterator begin() const noexcept
        {
            return { this, 0 };
        }

        const_iterator end() const noexcept
        {
            return { this, size() };
        }

        // The elements must be sorted in the ascending order for the result to be meaningful.
        search_result binary_search(const E &val) const
            requires std::totally_ordered<E>
        {
            return binary_search_by(size(), [&](const size_t idx) {
                return weak_compare(item(idx), val);
            });
        }

        bool contains(const E &val) const
            requires std::totally_ordered<E>
        {
            return binary_search(val).found;
        }

        std::vector<owned_type> to_vector() const
        {
            std::vector<owned_type> res {};
            res.reserve(size());
            for (size_t i = 0; i < size(); ++i)
                res.emplace_back(var_codec<E>::to_owned(item(i)));
            return res;
        }

        var_vec to_owned() const
        {
            return _from_owner(std::make_shared<uint8_vector>(_bytes));
        }

        bool operator==(const var_vec &o) const noexcept
        {
            return _bytes == o._bytes;
        }
    private:
        template<typename> friend struct var_codec;

        std::shared_ptr<const uint8_vector> _owner {};
        buffer _bytes {};
        fixed_vec<O> _offsets {};
        buffer _data {};

        // checks only that the header fits into the bytes
        static var_vec _parse_header(const buffer bytes)
        {
            if (bytes.size() < offset_width) [[unlikely]]
                throw length_mismatch_error(fmt::format("var_vec needs at least {} bytes for its element count but got {}", offset_width, bytes.size()));
            const size_t cnt = codec<O>::load(bytes.data());
            if (cnt + 2 > bytes.size() / offset_width) [[unlikely]]
                throw length_mismatch_error(fmt::format("var_vec header for {} elements does not fit into {} bytes", cnt, bytes.size()));
            var_vec res {};
            res._bytes = bytes;
            res._offsets = fixed_vec<O>::from_bytes(bytes.subbuf(offset_width, (cnt + 1) * offset_width));
            res._data = bytes.subbuf((cnt + 2) * offset_width);
            return res;
        }

        // bytes must have passed from_bytes before
        static var_vec _from_validated(const buffer bytes)
        {
            if (bytes.empty())
                return {};
            return _parse_header(bytes);
        }

        static var_vec _from_owner(std::shared_ptr<const uint8_vector> &&owner)
        {
            var_vec res = _from_validated(*owner);
            res._owner = std::move(owner);
            return res;
        }

        buffer _element_bytes(const size_t idx) const noexcept
        {
            const size_t off = _offsets.item(idx);
            return { _data.data() + off, _offsets.item(idx + 1) - off };
        }
    };

    template<var_encodable E, std::unsigned_integral O>
    struct var_codec<var_vec<E, O>> {
        using owned_type = std::vector<typename var_codec<E>::owned_type>;

        static void validate(const buffer bytes)
        {
            var_vec<E, O>::from_bytes(bytes);
        }

        static var_vec<E, O> view(const buffer bytes) noexcept
        {
            // the header of validated bytes always fits, so _from_validated cannot throw here
            return var_vec<E, O>::_from_validated(bytes);
        }

        static owned_type to_owned(const var_vec<E, O> &v)
        {
            return v.to_vector();
        }

        static void encode(uint8_vector &out, const var_vec<E, O> &v)
        {
            out << v.bytes();
        }

        template<std::ranges::input_range R>
            requires var_encodable_from<E, std::ranges::range_value_t<R>>
        static void encode(uint8_vector &out, const R &items)
        {
            var_vec<E, O>::write(out, items);
        }
    };
}

namespace fmt {
    template<typename E, typename O>
    struct formatter<zerokit::var_vec<E, O>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "[");
            for (size_t i = 0; i < v.size(); ++i)
                out_it = fmt::format_to(out_it, "{}{}", v[i], i + 1 < v.size() ? ", " : "");
            return fmt::format_to(out_it, "]");
        }
    };
}

#endif // !ZEROKIT_VAR_VEC_HPP
