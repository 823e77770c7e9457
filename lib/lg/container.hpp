/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_CONTAINER_HPP
#define LISTING_GUARD_CONTAINER_HPP

#include <map>
#include <vector>
#include <boost/container/flat_set.hpp>
#include <boost/container/flat_map.hpp>
#include <lg/common/format.hpp>

namespace listing_guard {
    template<typename T>
    using vector = std::vector<T>;

    template<typename K, typename V>
    using map = std::map<K, V>;

    template<typename K>
    struct flat_set: boost::container::flat_set<K> {
        using base_type = boost::container::flat_set<K>;
        using base_type::base_type;

        bool contains(const K &k) const
        {
            return base_type::find(k) != base_type::end();
        }
    };

    template<typename K, typename V>
    struct flat_map: boost::container::flat_map<K, V> {
        using base_type = boost::container::flat_map<K, V>;
        using base_type::base_type;

        bool contains(const K &k) const
        {
            return base_type::find(k) != base_type::end();
        }
    };
}

namespace fmt {
    template<typename T>
    struct formatter<listing_guard::flat_set<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return listing_guard::format_list(ctx.out(), v);
        }
    };
}

#endif // !LISTING_GUARD_CONTAINER_HPP
