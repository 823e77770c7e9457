/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_LISTING_AUTHORIZATION_HPP
#define LISTING_GUARD_LISTING_AUTHORIZATION_HPP

#include <lg/listing/types.hpp>

namespace listing_guard::listing {
    /*
     * A key owner consents by signing the transaction.
     * A script owner consents by being present in the withdrawals of the transaction, which forces its
     * withdrawal validator to run. The withdrawn amount is irrelevant and is usually zero.
     * Returns reject_reason::none when the owner consents.
     */
    extern reject_reason owner_consents(const credential_t &owner, const tx_context &ctx);

    extern bool has_any_signer(const key_hash_set &keys, const key_hash_set &signatories);
}

#endif // !LISTING_GUARD_LISTING_AUTHORIZATION_HPP
