/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_COMMON_FORMAT_HPP
#define LISTING_GUARD_COMMON_FORMAT_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#       pragma GCC diagnostic ignored "-Warray-bounds"
#       pragma GCC diagnostic ignored "-Wstringop-overflow"
#   endif
#endif
#include <fmt/core.h>
#include <fmt/format.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

#include "error.hpp"

namespace listing_guard {
    using fmt::format;

    // writes the items of a sequence as [a, b, c]
    template<typename OutIt, typename R>
    OutIt format_list(OutIt out_it, const R &items)
    {
        out_it = fmt::format_to(out_it, "[");
        for (auto it = items.begin(); it != items.end(); ++it) {
            if (it != items.begin())
                out_it = fmt::format_to(out_it, ", ");
            out_it = fmt::format_to(out_it, "{}", *it);
        }
        return fmt::format_to(out_it, "]");
    }
}

namespace fmt {
    template <typename T>
    concept derived_from_base = requires(T v)
    {
        { static_cast<typename T::base_type>(v) };
    };

    template<>
    struct formatter<std::span<const uint8_t>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::span<const uint8_t> &data, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = ctx.out();
            for (const auto b: data)
                out_it = fmt::format_to(out_it, "{:02X}", b);
            return out_it;
        }
    };

    template<size_t SZ>
    struct formatter<std::array<uint8_t, SZ>>: formatter<std::span<const uint8_t>> {
    };

    template<typename T, typename A>
    struct formatter<std::vector<T, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return listing_guard::format_list(ctx.out(), v);
        }
    };

    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "std::nullopt");
        }
    };

    template<derived_from_base T>
    struct formatter<T>: formatter<int> {
        template<typename FormatContext>
        auto format(const typename T::base_type &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v);
        }
    };
}

#endif // !LISTING_GUARD_COMMON_FORMAT_HPP
