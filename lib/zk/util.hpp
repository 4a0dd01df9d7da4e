/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_UTIL_HPP
#define ZEROKIT_UTIL_HPP

#include <compare>
#include <cstddef>
#include <iterator>
#include <zk/common/bytes.hpp>
#include <zk/common/format.hpp>

namespace zerokit {
    struct search_result {
        bool found = false;
        // the position of the match when found, otherwise the position at which the value would be inserted
        size_t index = 0;

        explicit operator bool() const noexcept
        {
            return found;
        }

        bool operator==(const search_result &o) const noexcept =default;
    };

    // cmp(idx) must compare the element at idx with the searched value.
    // Always terminates after O(log n) steps; the result is meaningful only for a sorted sequence.
    template<typename F>
    search_result binary_search_by(const size_t size, const F &cmp)
    {
        size_t lo = 0;
        size_t hi = size;
        while (lo < hi) {
            const size_t mid = lo + (hi - lo) / 2;
            const std::weak_ordering res = cmp(mid);
            if (res == std::weak_ordering::less) {
                lo = mid + 1;
            } else if (res == std::weak_ordering::greater) {
                hi = mid;
            } else {
                return { true, mid };
            }
        }
        return { false, lo };
    }

    // Like binary_search_by but returns the first position whose element is not less than the value.
    template<typename F>
    size_t lower_bound_by(const size_t size, const F &cmp)
    {
        size_t lo = 0;
        size_t hi = size;
        while (lo < hi) {
            const size_t mid = lo + (hi - lo) / 2;
            if (cmp(mid) == std::weak_ordering::less)
                lo = mid + 1;
            else
                hi = mid;
        }
        return lo;
    }

    template<typename T>
    std::weak_ordering weak_compare(const T &a, const T &b)
    {
        if (a < b)
            return std::weak_ordering::less;
        if (b < a)
            return std::weak_ordering::greater;
        return std::weak_ordering::equivalent;
    }

    // Random-access iterator over a container that materializes its elements on access: C::item(idx) returns by value.
    template<typename C, typename V>
    struct indexed_iterator {
        using iterator_concept = std::random_access_iterator_tag;
        using iterator_category = std::input_iterator_tag;
        using value_type = V;
        using difference_type = std::ptrdiff_t;
        using reference = V;
        using pointer = void;

        indexed_iterator() =default;

        indexed_iterator(const C *container, const size_t idx):
            _container { container }, _idx { idx }
        {
        }

        V operator*() const
        {
            return _container->item(_idx);
        }

        V operator[](const difference_type off) const
        {
            return _container->item(_idx + off);
        }

        indexed_iterator &operator++()
        {
            ++_idx;
            return *this;
        }

        indexed_iterator operator++(int)
        {
            auto tmp = *this;
            ++_idx;
            return tmp;
        }

        indexed_iterator &operator--()
        {
            --_idx;
            return *this;
        }

        indexed_iterator operator--(int)
        {
            auto tmp = *this;
            --_idx;
            return tmp;
        }

        indexed_iterator &operator+=(const difference_type off)
        {
            _idx += off;
            return *this;
        }

        indexed_iterator &operator-=(const difference_type off)
        {
            _idx -= off;
            return *this;
        }

        friend indexed_iterator operator+(indexed_iterator it, const difference_type off)
        {
            return it += off;
        }

        friend indexed_iterator operator+(const difference_type off, indexed_iterator it)
        {
            return it += off;
        }

        friend indexed_iterator operator-(indexed_iterator it, const difference_type off)
        {
            return it -= off;
        }

        friend difference_type operator-(const indexed_iterator &a, const indexed_iterator &b)
        {
            return static_cast<difference_type>(a._idx) - static_cast<difference_type>(b._idx);
        }

        bool operator==(const indexed_iterator &o) const noexcept
        {
            return _idx == o._idx;
        }

        auto operator<=>(const indexed_iterator &o) const noexcept
        {
            return _idx <=> o._idx;
        }

        size_t index() const noexcept
        {
            return _idx;
        }
    private:
        const C *_container = nullptr;
        size_t _idx = 0;
    };
}

namespace fmt {
    template<>
    struct formatter<zerokit::search_result>: formatter<int> {
        template<typename FormatContext>
        auto format(const zerokit::search_result &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}({})", v.found ? "found" : "insert_at", v.index);
        }
    };
}

#endif // !ZEROKIT_UTIL_HPP
