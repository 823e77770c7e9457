/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/cbor/decoder.hpp>
#include <lg/listing/datum-tag.hpp>
#include <lg/plutus/data-encoder.hpp>

namespace listing_guard::listing {
    uint8_vector out_ref_data(const cardano::tx_out_ref &ref)
    {
        plutus::data_encoder enc {};
        enc.constr(0, 2, [&](auto &fields) {
            fields.constr(0, 1, [&](auto &tx_id) {
                tx_id.bytes(ref.hash);
            });
            fields.uint(ref.idx);
        });
        return enc.cbor();
    }

    blake2b_256_hash datum_tag_hash(const cardano::tx_out_ref &ref)
    {
        return blake2b<blake2b_256_hash>(out_ref_data(ref));
    }

    cardano::datum_option_t datum_tag(const cardano::tx_out_ref &ref)
    {
        plutus::data_encoder enc {};
        enc.bytes(datum_tag_hash(ref));
        return { enc.cbor() };
    }

    // a datum that is not a well-formed byte string is simply not a tag
    static std::optional<uint8_vector> bytes_data(const uint8_vector &datum_cbor)
    {
        try {
            cbor::decoder dec { datum_cbor };
            auto bytes = dec.bytes();
            if (dec.done())
                return bytes;
        } catch (const cbor::error &) {
        }
        return {};
    }

    bool carries_tag(const std::optional<cardano::datum_option_t> &datum, const cardano::datum_option_t &tag)
    {
        if (!datum)
            return false;
        if (!datum->is_inline() || !tag.is_inline())
            return *datum == tag;
        const auto datum_bytes = bytes_data(std::get<uint8_vector>(datum->val));
        const auto tag_bytes = bytes_data(std::get<uint8_vector>(tag.val));
        return datum_bytes && tag_bytes && *datum_bytes == *tag_bytes;
    }
}
