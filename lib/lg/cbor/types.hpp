/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_CBOR_TYPES_HPP
#define LISTING_GUARD_CBOR_TYPES_HPP

#include <cstdint>

namespace listing_guard::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    // the additional information of an item's initial byte that the encoder and decoder act upon
    enum class special_val: uint8_t {
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    // the initial byte of an item: the major type in the top three bits and the additional information below
    struct head {
        major_type typ;
        uint8_t info;

        static constexpr head from_byte(const uint8_t b) noexcept
        {
            return { static_cast<major_type>(b >> 5), static_cast<uint8_t>(b & 0x1F) };
        }

        constexpr uint8_t byte() const noexcept
        {
            return static_cast<uint8_t>((static_cast<uint8_t>(typ) << 5) | (info & 0x1F));
        }

        constexpr bool indefinite() const noexcept
        {
            return info == static_cast<uint8_t>(special_val::s_break);
        }
    };

    constexpr uint8_t break_byte = head { major_type::simple, static_cast<uint8_t>(special_val::s_break) }.byte();
}

#endif // !LISTING_GUARD_CBOR_TYPES_HPP
