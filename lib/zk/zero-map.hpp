/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_ZERO_MAP_HPP
#define ZEROKIT_ZERO_MAP_HPP

#include <algorithm>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <utility>
#include <zk/container.hpp>
#include <zk/logger.hpp>
#include <zk/var-vec.hpp>

namespace zerokit {
    // Selects the zero-copy sequence that stores elements of type T: fixed_vec for fixed-width types, var_vec otherwise.
    template<typename T>
    struct zero_vec_for;

    template<fixed_encodable T>
    struct zero_vec_for<T> {
        using type = fixed_vec<T>;
        using owned_type = T;

        static owned_type to_owned(const T &v)
        {
            return v;
        }
    };

    template<typename T>
        requires (!fixed_encodable<T>) && var_encodable<T>
    struct zero_vec_for<T> {
        using type = var_vec<T>;
        using owned_type = typename var_codec<T>::owned_type;

        static owned_type to_owned(const T &v)
        {
            return var_codec<T>::to_owned(v);
        }
    };

    template<typename T>
    using zero_vec_t = typename zero_vec_for<T>::type;

    template<typename T>
    using zero_owned_t = typename zero_vec_for<T>::owned_type;

    template<typename K, typename V>
    struct zero_map_builder;

    /*
     * A sorted map over a byte slice. Layout:
     *   u32 little-endian byte length of the key region, the key region, the value region
     * where the key region is a zero-copy sequence of strictly increasing keys and
     * the value region a parallel sequence with the same number of values.
     * An empty byte slice is the empty map. Values may be zero_maps themselves.
     */
    template<typename K, typename V>
        requires std::totally_ordered<K>
    struct zero_map {
        using key_type = K;
        using mapped_type = V;
        using value_type = std::pair<K, V>;
        using keys_type = zero_vec_t<K>;
        using values_type = zero_vec_t<V>;
        using owned_type = std::map<zero_owned_t<K>, zero_owned_t<V>>;
        using const_iterator = indexed_iterator<zero_map, value_type>;
        using iterator = const_iterator;
        using range_type = std::ranges::subrange<const_iterator>;
        using builder_type = zero_map_builder<K, V>;
        static constexpr size_t header_size = sizeof(uint32_t);

        // Validates the whole structure including the keys' order. Throws zero_copy_error.
        static zero_map from_bytes(const buffer bytes)
        {
            if (bytes.empty())
                return {};
            const auto [key_bytes, value_bytes] = _split(bytes);
            zero_map res {};
            res._bytes = bytes;
            res._keys = keys_type::from_bytes(key_bytes);
            res._values = values_type::from_bytes(value_bytes);
            if (res._keys.size() != res._values.size()) [[unlikely]]
                throw length_mismatch_error(fmt::format("zero_map has {} keys but {} values", res._keys.size(), res._values.size()));
            for (size_t i = 1; i < res._keys.size(); ++i) {
                if (!(res._keys.item(i - 1) < res._keys.item(i))) [[unlikely]]
                    throw unsorted_keys_error(fmt::format("zero_map key #{} is not greater than the preceding one", i));
            }
            return res;
        }

        // Keys must be in strictly increasing order and have the same number of items as values.
        template<std::ranges::input_range KR, std::ranges::input_range VR>
        static void write(uint8_vector &out, const KR &keys, const VR &values)
        {
            uint8_vector key_bytes {};
            var_codec<keys_type>::encode(key_bytes, keys);
            uint8_vector value_bytes {};
            var_codec<values_type>::encode(value_bytes, values);
            if (key_bytes.empty() && value_bytes.empty())
                return;
            encode_to<uint32_t>(out, narrow_cast<uint32_t>(key_bytes.size()));
            out << static_cast<buffer>(key_bytes);
            out << static_cast<buffer>(value_bytes);
        }

        /*
         * A map ordered by std::less over the owned key type is already sorted and unique, so it is written as is.
         * Any other map is re-sorted under the order of K. Keys that collapse into one when converted
         * throw duplicate_key_error and integers that do not fit into K throw error.
         */
        template<typename OK, typename OV, typename C, typename A>
        static zero_map from(const std::map<OK, OV, C, A> &items)
        {
            if constexpr (_presorted<OK, C>) {
                auto data = std::make_shared<uint8_vector>();
                write(*data, std::views::keys(items), std::views::values(items));
                return _from_owner(std::move(data));
            } else {
                builder_type b {};
                for (const auto &[k, v]: items)
                    b.insert(k, v);
                return b.freeze();
            }
        }

        // Items may come in any order. Throws duplicate_key_error.
        static zero_map from(const std::initializer_list<value_type> items)
        {
            builder_type b {};
            for (const auto &[k, v]: items)
                b.insert(zero_vec_for<K>::to_owned(k), zero_vec_for<V>::to_owned(v));
            return b.freeze();
        }

        zero_map() =default;

        size_t size() const noexcept
        {
            return _keys.size();
        }

        bool empty() const noexcept
        {
            return _keys.empty();
        }

        buffer bytes() const noexcept
        {
            return _bytes;
        }

        bool is_owned() const noexcept
        {
            return static_cast<bool>(_owner);
        }

        const keys_type &keys() const noexcept
        {
            return _keys;
        }

        const values_type &values() const noexcept
        {
            return _values;
        }

        search_result find(const K &key) const
        {
            return binary_search_by(size(), [&](const size_t idx) {
                return weak_compare(_keys.item(idx), key);
            });
        }

        std::optional<size_t> find_index(const K &key) const
        {
            if (const auto res = find(key); res)
                return res.index;
            return {};
        }

        bool contains(const K &key) const
        {
            return find(key).found;
        }

        std::optional<V> get(const K &key) const
        {
            if (const auto res = find(key); res)
                return _values.item(res.index);
            return {};
        }

        V at(const K &key) const
        {
            if (const auto res = find(key); res) [[likely]]
                return _values.item(res.index);
            throw error(fmt::format("zero_map of size {} has no requested key", size()));
        }

        // idx must be less than size()
        value_type item(const size_t idx) const noexcept
        {
            return { _keys.item(idx), _values.item(idx) };
        }

        std::optional<value_type> get_by_index(const size_t idx) const noexcept
        {
            if (idx < size()) [[likely]]
                return item(idx);
            return {};
        }

        const_iterator begin() const noexcept
        {
            return { this, 0 };
        }

        const_iterator end() const noexcept
        {
            return { this, size() };
        }

        // entries with lo <= key < hi in the ascending key order
        range_type range(const K &lo, const K &hi) const
        {
            const auto lo_idx = _lower_bound(lo);
            const auto hi_idx = std::max(lo_idx, _lower_bound(hi));
            return { const_iterator { this, lo_idx }, const_iterator { this, hi_idx } };
        }

        owned_type to_map() const
        {
            owned_type res {};
            for (size_t i = 0; i < size(); ++i)
                res.emplace_hint(res.end(), zero_vec_for<K>::to_owned(_keys.item(i)), zero_vec_for<V>::to_owned(_values.item(i)));
            return res;
        }

        zero_map to_owned() const
        {
            return _from_owner(std::make_shared<uint8_vector>(_bytes));
        }

        bool operator==(const zero_map &o) const noexcept
        {
            return _bytes == o._bytes;
        }
    private:
        template<typename> friend struct var_codec;
        friend builder_type;

        template<typename OK, typename C>
        static constexpr bool _presorted = std::is_same_v<OK, zero_owned_t<K>>
            && (std::is_same_v<C, std::less<OK>> || std::is_same_v<C, std::less<>>);

        std::shared_ptr<const uint8_vector> _owner {};
        buffer _bytes {};
        keys_type _keys {};
        values_type _values {};

        static std::pair<buffer, buffer> _split(const buffer bytes)
        {
            if (bytes.size() < header_size) [[unlikely]]
                throw length_mismatch_error(fmt::format("zero_map needs at least {} bytes for its header but got {}", header_size, bytes.size()));
            const size_t keys_size = codec<uint32_t>::load(bytes.data());
            if (keys_size > bytes.size() - header_size) [[unlikely]]
                throw length_mismatch_error(fmt::format("zero_map key region of {} bytes does not fit into {} bytes", keys_size, bytes.size() - header_size));
            return bytes.subbuf(header_size).split_at(keys_size);
        }

        // bytes must have passed from_bytes before
        static zero_map _from_validated(const buffer bytes)
        {
            if (bytes.empty())
                return {};
            const auto [key_bytes, value_bytes] = _split(bytes);
            zero_map res {};
            res._bytes = bytes;
            res._keys = var_codec<keys_type>::view(key_bytes);
            res._values = var_codec<values_type>::view(value_bytes);
            return res;
        }

        static zero_map _from_owner(std::shared_ptr<const uint8_vector> &&owner)
        {
            zero_map res = _from_validated(*owner);
            res._owner = std::move(owner);
            return res;
        }

        size_t _lower_bound(const K &key) const
        {
            return lower_bound_by(size(), [&](const size_t idx) {
                return weak_compare(_keys.item(idx), key);
            });
        }
    };

    template<typename K, typename V>
    struct var_codec<zero_map<K, V>> {
        using owned_type = typename zero_map<K, V>::owned_type;

        static void validate(const buffer bytes)
        {
            zero_map<K, V>::from_bytes(bytes);
        }

        static zero_map<K, V> view(const buffer bytes) noexcept
        {
            // the header of validated bytes always fits, so _from_validated cannot throw here
            return zero_map<K, V>::_from_validated(bytes);
        }

        static owned_type to_owned(const zero_map<K, V> &v)
        {
            return v.to_map();
        }

        static void encode(uint8_vector &out, const zero_map<K, V> &v)
        {
            out << v.bytes();
        }

        template<typename OK, typename OV, typename C, typename A>
        static void encode(uint8_vector &out, const std::map<OK, OV, C, A> &items)
        {
            if constexpr (zero_map<K, V>::template _presorted<OK, C>)
                zero_map<K, V>::write(out, std::views::keys(items), std::views::values(items));
            else
                out << zero_map<K, V>::from(items).bytes();
        }
    };

    // The owned, mutable state of a zero_map before it is frozen into bytes.
    template<typename K, typename V>
    struct zero_map_builder {
        using map_type = zero_map<K, V>;
        using key_type = zero_owned_t<K>;
        using mapped_type = zero_owned_t<V>;

        // Throws duplicate_key_error when the key is already present
        template<typename KK, typename VV>
        void insert(KK &&key, VV &&val)
        {
            key_type k = checked_cast<key_type>(std::forward<KK>(key));
            if (const auto idx = _items.find_index(k); idx) [[unlikely]] {
                if constexpr (fmt::is_formattable<key_type>::value)
                    throw duplicate_key_error(fmt::format("zero_map already has key {} at position {}", k, *idx));
                else
                    throw duplicate_key_error(fmt::format("zero_map already has the key at position {}", *idx));
            }
            _items.emplace_unique(std::move(k), checked_cast<mapped_type>(std::forward<VV>(val)));
        }

        // the key's position in the frozen map if no other keys are inserted
        std::optional<size_t> find_index(const key_type &key) const
        {
            return _items.find_index(key);
        }

        bool contains(const key_type &key) const
        {
            return find_index(key).has_value();
        }

        size_t size() const noexcept
        {
            return _items.size();
        }

        bool empty() const noexcept
        {
            return _items.empty();
        }

        void clear()
        {
            _items.clear();
        }

        map_type freeze() const
        {
            auto data = std::make_shared<uint8_vector>();
            map_type::write(*data, std::views::keys(_items), std::views::values(_items));
            logger::trace("froze a zero_map with {} items into {} bytes", _items.size(), data->size());
            return map_type::_from_owner(std::move(data));
        }
    private:
        flat_map<key_type, mapped_type> _items {};
    };
}

namespace fmt {
    template<typename K, typename V>
    struct formatter<zerokit::zero_map<K, V>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return zerokit::format_sequence(ctx.out(), v, "{", "}", [](auto out_it, const auto &item) {
                return fmt::format_to(out_it, "{}: {}", item.first, item.second);
            });
        }
    };
}

#endif // !ZEROKIT_ZERO_MAP_HPP
