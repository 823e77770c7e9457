/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_CBOR_ENCODER_HPP
#define LISTING_GUARD_CBOR_ENCODER_HPP

#include <limits>
#include <lg/common/bytes.hpp>
#include <lg/cbor/types.hpp>

namespace listing_guard::cbor {
    struct encoder {
        // indefinite-length array, must be closed with s_break
        encoder &array()
        {
            _encode_item(major_type::array, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &array(const size_t sz)
        {
            _encode_uint_item(major_type::array, sz);
            return *this;
        }

        encoder &uint(const uint64_t val)
        {
            _encode_uint_item(major_type::uint, val);
            return *this;
        }

        // indefinite-length byte string, must be closed with s_break
        encoder &bytes()
        {
            _encode_item(major_type::bytes, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &bytes(const buffer buf)
        {
            _encode_uint_item(major_type::bytes, buf.size());
            _buf << buf;
            return *this;
        }

        encoder &s_break()
        {
            _buf << break_byte;
            return *this;
        }

        encoder &tag(const uint64_t id)
        {
            _encode_uint_item(major_type::tag, id);
            return *this;
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _buf;
        }
    private:
        uint8_vector _buf {};

        void _encode_uint_item(const major_type typ, const uint64_t val)
        {
            if (val < 24) {
                _encode_item(typ, static_cast<uint8_t>(val));
            } else if (val <= std::numeric_limits<uint8_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::one_byte));
                _buf << static_cast<uint8_t>(val);
            } else if (val <= std::numeric_limits<uint16_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::two_bytes));
                _buf << buffer::from(host_to_net<uint16_t>(val));
            } else if (val <= std::numeric_limits<uint32_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::four_bytes));
                _buf << buffer::from(host_to_net<uint32_t>(val));
            } else {
                _encode_item(typ, static_cast<uint8_t>(special_val::eight_bytes));
                _buf << buffer::from(host_to_net<uint64_t>(val));
            }
        }

        void _encode_item(const major_type typ, const uint8_t special)
        {
            _buf << head { typ, special }.byte();
        }
    };
}

#endif // !LISTING_GUARD_CBOR_ENCODER_HPP
