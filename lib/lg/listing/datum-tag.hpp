/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_LISTING_DATUM_TAG_HPP
#define LISTING_GUARD_LISTING_DATUM_TAG_HPP

#include <lg/cardano/types.hpp>

namespace listing_guard::listing {
    // CBOR of the out_ref as the Plutus V2 TxOutRef data: Constr 0 [Constr 0 [tx_hash], idx]
    extern uint8_vector out_ref_data(const cardano::tx_out_ref &);
    extern blake2b_256_hash datum_tag_hash(const cardano::tx_out_ref &);
    // The inline datum every output tied to the purchase of the listing locked at out_ref must carry
    extern cardano::datum_option_t datum_tag(const cardano::tx_out_ref &);

    /*
     * Compares the datum with the tag as Plutus data, so any well-formed CBOR encoding of the tag's
     * byte string matches. A datum hash never matches an inline tag.
     */
    extern bool carries_tag(const std::optional<cardano::datum_option_t> &datum, const cardano::datum_option_t &tag);
}

#endif // !LISTING_GUARD_LISTING_DATUM_TAG_HPP
