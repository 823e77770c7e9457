/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifndef LISTING_GUARD_CBOR_DECODER_HPP
#define LISTING_GUARD_CBOR_DECODER_HPP

#include <lg/common/bytes.hpp>
#include <lg/cbor/types.hpp>

namespace listing_guard::cbor {
    struct error: listing_guard::error {
        using listing_guard::error::error;
    };

    /*
     * Reads CBOR items one after another from a buffer.
     * Accepts every well-formed encoding of an item, including the non-minimal argument sizes
     * and the indefinite-length form of byte strings.
     */
    struct decoder {
        explicit decoder(const buffer data): _data { data }
        {
        }

        bool done() const noexcept
        {
            return _pos == _data.size();
        }

        uint8_vector bytes()
        {
            const auto h = _read_head();
            if (h.typ != major_type::bytes) [[unlikely]]
                throw error(fmt::format("expected a byte string but got major type {}", static_cast<int>(h.typ)));
            uint8_vector res {};
            if (!h.indefinite()) {
                res << _take(_read_arg(h.info));
                return res;
            }
            // each chunk consumes at least one byte, so the loop ends within the buffer
            for (;;) {
                if (_peek() == break_byte) {
                    ++_pos;
                    return res;
                }
                const auto chunk = _read_head();
                if (chunk.typ != major_type::bytes || chunk.indefinite()) [[unlikely]]
                    throw error("an indefinite byte string may contain only definite byte string chunks");
                res << _take(_read_arg(chunk.info));
            }
        }
    private:
        buffer _data;
        size_t _pos = 0;

        uint8_t _peek() const
        {
            if (_pos >= _data.size()) [[unlikely]]
                throw error("insufficient data to parse a CBOR value");
            return _data[_pos];
        }

        head _read_head()
        {
            const auto h = head::from_byte(_peek());
            ++_pos;
            return h;
        }

        buffer _take(const uint64_t sz)
        {
            if (sz > _data.size() - _pos) [[unlikely]]
                throw error(fmt::format("a CBOR item of {} bytes does not fit into the remaining {} bytes", sz, _data.size() - _pos));
            const auto res = _data.subbuf(_pos, static_cast<size_t>(sz));
            _pos += static_cast<size_t>(sz);
            return res;
        }

        uint64_t _read_arg(const uint8_t info)
        {
            if (info < static_cast<uint8_t>(special_val::one_byte))
                return info;
            size_t num_bytes;
            switch (static_cast<special_val>(info)) {
                case special_val::one_byte: num_bytes = 1; break;
                case special_val::two_bytes: num_bytes = 2; break;
                case special_val::four_bytes: num_bytes = 4; break;
                case special_val::eight_bytes: num_bytes = 8; break;
                default: throw error(fmt::format("unsupported additional information value: {}", info));
            }
            uint64_t val = 0;
            for (const auto b: _take(num_bytes))
                val = (val << 8) | b;
            return val;
        }
    };
}

#endif // !LISTING_GUARD_CBOR_DECODER_HPP
