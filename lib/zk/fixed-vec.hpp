/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_FIXED_VEC_HPP
#define ZEROKIT_FIXED_VEC_HPP

#include <initializer_list>
#include <memory>
#include <optional>
#include <ranges>
#include <vector>
#include <zk/codec.hpp>
#include <zk/narrow-cast.hpp>
#include <zk/util.hpp>

namespace zerokit {
    template<typename E>
    struct var_codec;

    /*
     * A sequence of fixed-width elements read directly from little-endian bytes.
     * A fixed_vec either borrows its bytes (from_bytes) or shares the ownership of a buffer
     * it has encoded itself (from). In both cases the bytes are never modified after construction,
     * so a constructed fixed_vec can be read from multiple threads concurrently.
     */
    template<fixed_encodable T>
    struct fixed_vec {
        using value_type = T;
        using const_iterator = indexed_iterator<fixed_vec, T>;
        using iterator = const_iterator;
        static constexpr size_t item_width = codec<T>::width;

        // Borrows the bytes. Throws length_mismatch_error and invalid_element_error.
        static fixed_vec from_bytes(const buffer bytes)
        {
            validate<T>(bytes);
            return fixed_vec { bytes };
        }

        // Integers that do not fit into T throw error
        template<std::ranges::input_range R>
            requires std::convertible_to<std::ranges::range_reference_t<const R>, T>
        static fixed_vec from(const R &items)
        {
            auto data = std::make_shared<uint8_vector>();
            if constexpr (std::ranges::sized_range<const R>)
                data->reserve(std::ranges::size(items) * item_width);
            for (auto &&v: items)
                encode_to<T>(*data, checked_cast<T>(v));
            return fixed_vec { std::move(data) };
        }

        static fixed_vec from(const std::initializer_list<T> items)
        {
            return from<std::initializer_list<T>>(items);
        }

        fixed_vec() =default;

        size_t size() const noexcept
        {
            return _bytes.size() / item_width;
        }

        bool empty() const noexcept
        {
            return _bytes.empty();
        }

        buffer bytes() const noexcept
        {
            return _bytes;
        }

        bool is_owned() const noexcept
        {
            return static_cast<bool>(_owner);
        }

        // idx must be less than size()
        T item(const size_t idx) const noexcept
        {
            return codec<T>::load(_bytes.data() + idx * item_width);
        }

        T operator[](const size_t idx) const noexcept
        {
            return item(idx);
        }

        std::optional<T> get(const size_t idx) const noexcept
        {
            if (idx < size()) [[likely]]
                return (*this)[idx];
            return {};
        }

        T at(const size_t idx) const
        {
            if (idx < size()) [[likely]]
                return (*this)[idx];
            throw index_out_of_range_error(fmt::format("fixed_vec index out of range: {} >= {}", idx, size()));
        }

        std::optional<T> first() const noexcept
        {
            return get(0);
        }

        std::optional<T> last() const noexcept
        {
            if (empty())
                return {};
            return (*this)[size() - 1];
        }

        T front() const
        {
            return at(0);
        }

        T back() const
        {
            if (empty()) [[unlikely]]
                throw index_out_of_range_error("back() called on an empty fixed_vec");
            return (*this)[size() - 1];
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
        search_result binary_search(const T &val) const
        {
            return binary_search_by(size(), [&](const size_t idx) {
                return weak_compare(item(idx), val);
            });
        }

        bool contains(const T &val) const
        {
            return binary_search(val).found;
        }

        fixed_vec subvec(const size_t offset, const size_t count) const
        {
            if (offset > size() || count > size() - offset) [[unlikely]]
                throw index_out_of_range_error(fmt::format("subvec [{}, {}) is outside of a fixed_vec of size {}", offset, offset + count, size()));
            fixed_vec res { _bytes.subbuf(offset * item_width, count * item_width) };
            res._owner = _owner;
            return res;
        }

        std::vector<T> to_vector() const
        {
            std::vector<T> res {};
            res.reserve(size());
            for (size_t i = 0; i < size(); ++i)
                res.emplace_back((*this)[i]);
            return res;
        }

        // A copy that owns its bytes independently of the original buffer
        fixed_vec to_owned() const
        {
            return fixed_vec { std::make_shared<uint8_vector>(_bytes) };
        }

        bool operator==(const fixed_vec &o) const noexcept
        {
            return _bytes == o._bytes;
        }
    private:
        template<typename> friend struct var_codec;

        std::shared_ptr<const uint8_vector> _owner {};
        buffer _bytes {};

        // bytes must have passed from_bytes before
        static fixed_vec _from_validated(const buffer bytes) noexcept
        {
            return fixed_vec { bytes };
        }

        explicit fixed_vec(const buffer bytes) noexcept:
            _bytes { bytes }
        {
        }

        explicit fixed_vec(std::shared_ptr<const uint8_vector> &&owner):
            _owner { std::move(owner) }, _bytes { *_owner }
        {
        }
    };
}

namespace fmt {
    template<typename T>
    struct formatter<zerokit::fixed_vec<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "[");
            for (size_t i = 0; i < v.size(); ++i)
                out_it = fmt::format_to(out_it, "{}{}", v[i], i + 1 < v.size() ? ", " : "");
            return fmt::format_to(out_it, "]");
        }
    };
}

#endif // !ZEROKIT_FIXED_VEC_HPP
