/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/listing/authorization.hpp>

namespace listing_guard::listing {
    reject_reason owner_consents(const credential_t &owner, const tx_context &ctx)
    {
        if (!owner.script)
            return ctx.extra_signatories.contains(owner.hash) ? reject_reason::none : reject_reason::owner_signature_missing;
        return ctx.withdrawals.contains(owner) ? reject_reason::none : reject_reason::owner_withdrawal_missing;
    }

    bool has_any_signer(const key_hash_set &keys, const key_hash_set &signatories)
    {
        for (const auto &k: keys) {
            if (signatories.contains(k))
                return true;
        }
        return false;
    }
}
