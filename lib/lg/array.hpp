/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_ARRAY_HPP
#define LISTING_GUARD_ARRAY_HPP

#include <array>
#include <cstring>
#include <span>
#include <lg/common/error.hpp>
#include <lg/common/format.hpp>
#include <lg/common/bytes.hpp>

namespace listing_guard {
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;
        using base_type::base_type;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data;
            init_from_hex(data, hex);
            return data;
        }

        byte_array() =default;

        byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), s.data(), SZ);
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }
    };
}

#endif // !LISTING_GUARD_ARRAY_HPP
