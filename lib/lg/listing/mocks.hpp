/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_LISTING_MOCKS_HPP
#define LISTING_GUARD_LISTING_MOCKS_HPP

#include <algorithm>
#include <lg/listing/datum-tag.hpp>
#include <lg/listing/types.hpp>

namespace listing_guard::listing::mocks {
    inline key_hash key(const uint8_t fill)
    {
        key_hash k {};
        std::fill(k.begin(), k.end(), fill);
        return k;
    }

    inline credential_t key_cred(const uint8_t fill)
    {
        return { key(fill), false };
    }

    inline credential_t script_cred(const uint8_t fill)
    {
        return { key(fill), true };
    }

    inline cardano::address addr(const uint8_t fill)
    {
        return { key_cred(fill), key_cred(fill + 1) };
    }

    inline tx_out_ref spent_ref(const tx_out_idx idx=0)
    {
        return { tx_hash::from_hex("0123456789ABCDEF0123456789ABCDEF0123456789ABCDEF0123456789ABCDEF"), idx };
    }

    inline key_hash authorizer()
    {
        return key(0xA1);
    }

    inline cardano::address fee_address()
    {
        return { script_cred(0xFE), key_cred(0xFD) };
    }

    inline validator_config config()
    {
        return { { authorizer() }, fee_address() };
    }

    inline tx_output output(const cardano::address &to, const uint64_t coin, std::optional<datum_option_t> datum={})
    {
        return { to, coin, std::move(datum) };
    }

    inline tx_context spend_context(tx_output_list &&outputs, key_hash_set &&signatories={}, const tx_out_idx idx=0)
    {
        return { std::move(outputs), std::move(signatories), {}, purpose_spend { spent_ref(idx) } };
    }
}

#endif // !LISTING_GUARD_LISTING_MOCKS_HPP
