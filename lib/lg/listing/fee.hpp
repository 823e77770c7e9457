/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_LISTING_FEE_HPP
#define LISTING_GUARD_LISTING_FEE_HPP

#include <optional>
#include <lg/listing/types.hpp>

namespace listing_guard::listing {
    static constexpr uint64_t fee_numerator = 50;
    static constexpr uint64_t fee_denominator = 49;

    /*
     * Approximates 2% of the total including the fee: floor(floor(payouts_sum * 50 / 49) / 50).
     * The order of the truncating operations is a part of the on-chain contract and must not change.
     * Returns std::nullopt when payouts_sum * 50 does not fit into 64 bits.
     */
    extern std::optional<uint64_t> marketplace_fee(uint64_t payouts_sum);

    extern bool verify_fee_output(const tx_output &out, uint64_t fee, const cardano::address &fee_address, const datum_option_t &tag);
}

#endif // !LISTING_GUARD_LISTING_FEE_HPP
