/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_CONTAINER_HPP
#define ZEROKIT_CONTAINER_HPP

#include <optional>
#include <utility>
#include <boost/container/flat_map.hpp>
#include <zk/common/format.hpp>

namespace zerokit {
    // A sorted vector-backed map used as the mutable staging area of the zero-copy builders
    template<typename K, typename V>
    struct flat_map: boost::container::flat_map<K, V> {
        using base_type = boost::container::flat_map<K, V>;
        using base_type::base_type;

        // the position the key has in the sorted order, which is also its position once frozen
        std::optional<size_t> find_index(const K &key) const
        {
            if (const auto it = base_type::find(key); it != base_type::end())
                return base_type::index_of(it);
            return {};
        }

        // Inserts the item unless the key is already present. Returns the item's position and whether it was inserted.
        template<typename KK, typename VV>
        std::pair<size_t, bool> emplace_unique(KK &&key, VV &&val)
        {
            const auto [it, created] = base_type::try_emplace(std::forward<KK>(key), std::forward<VV>(val));
            return { base_type::index_of(it), created };
        }
    };
}

namespace fmt {
    template<typename K, typename V>
    struct formatter<zerokit::flat_map<K, V>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return zerokit::format_sequence(ctx.out(), v, "{", "}", [](auto out_it, const auto &item) {
                return fmt::format_to(out_it, "{}: {}", item.first, item.second);
            });
        }
    };
}

#endif // !ZEROKIT_CONTAINER_HPP
