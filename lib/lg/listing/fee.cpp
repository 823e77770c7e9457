/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <lg/listing/datum-tag.hpp>
#include <lg/listing/fee.hpp>

namespace listing_guard::listing {
    std::optional<uint64_t> marketplace_fee(const uint64_t payouts_sum)
    {
        if (payouts_sum > std::numeric_limits<uint64_t>::max() / fee_numerator) [[unlikely]]
            return {};
        const uint64_t total = payouts_sum * fee_numerator / fee_denominator;
        return total / fee_numerator;
    }

    bool verify_fee_output(const tx_output &out, const uint64_t fee, const cardano::address &fee_address, const datum_option_t &tag)
    {
        return out.addr == fee_address && out.coin >= fee && carries_tag(out.datum, tag);
    }
}
