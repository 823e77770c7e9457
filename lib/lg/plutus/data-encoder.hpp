/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_PLUTUS_DATA_ENCODER_HPP
#define LISTING_GUARD_PLUTUS_DATA_ENCODER_HPP

#include <functional>
#include <lg/cbor/encoder.hpp>

namespace listing_guard::plutus {
    /*
     * Produces the canonical CBOR form of Plutus data as done by the serialiseData builtin:
     * constructor ids are packed into the 121-127, 1280-1400, or 102 tags,
     * non-empty lists use the indefinite-length encoding,
     * and byte strings longer than 64 bytes are chunked.
     */
    struct data_encoder {
        using fields_func = std::function<void(data_encoder &)>;

        data_encoder &constr(const uint64_t id, const size_t num_fields, const fields_func &fields)
        {
            if (id <= 6) {
                _enc.tag(id + 121);
            } else if (id <= 127) {
                _enc.tag(id - 7 + 1280);
            } else {
                _enc.tag(102);
                _enc.array(2);
                _enc.uint(id);
            }
            return list(num_fields, fields);
        }

        data_encoder &list(const size_t num_items, const fields_func &items)
        {
            if (num_items > 0) {
                _enc.array();
                items(*this);
                _enc.s_break();
            } else {
                _enc.array(0);
            }
            return *this;
        }

        data_encoder &bytes(const buffer b)
        {
            if (b.size() <= 64) {
                _enc.bytes(b);
            } else {
                _enc.bytes();
                for (size_t i = 0; i < b.size(); i += 64)
                    _enc.bytes(b.subbuf(i, std::min(size_t { 64 }, b.size() - i)));
                _enc.s_break();
            }
            return *this;
        }

        data_encoder &uint(const uint64_t u)
        {
            _enc.uint(u);
            return *this;
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _enc.cbor();
        }
    private:
        cbor::encoder _enc {};
    };
}

#endif // !LISTING_GUARD_PLUTUS_DATA_ENCODER_HPP
