/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_LISTING_PAYOUTS_HPP
#define LISTING_GUARD_LISTING_PAYOUTS_HPP

#include <optional>
#include <span>
#include <lg/listing/types.hpp>

namespace listing_guard::listing {
    using output_slice = std::span<const tx_output>;

    enum class tag_rule {
        // every output must carry the tag
        required,
        // an output may carry no datum at all, any datum it carries must be the tag
        absent_or_tag
    };

    /*
     * Returns exactly num_outputs consecutive outputs starting at offset.
     * Returns std::nullopt when the offset is negative or not enough outputs follow it.
     */
    extern std::optional<output_slice> match_outputs(const tx_output_list &outputs, int64_t offset, size_t num_outputs);

    /*
     * Pairs outputs and payouts by their position. The i-th output must pay to the i-th payout's destination
     * at least its amount and its datum must satisfy the tag rule.
     * Returns the sum of the payout amounts when every pair matches and std::nullopt otherwise.
     */
    extern std::optional<uint64_t> verify_payouts(output_slice outputs, const payout_list &payouts, const datum_option_t &tag, tag_rule rule);
}

#endif // !LISTING_GUARD_LISTING_PAYOUTS_HPP
