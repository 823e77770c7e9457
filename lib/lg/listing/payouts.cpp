/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <lg/listing/datum-tag.hpp>
#include <lg/listing/payouts.hpp>

namespace listing_guard::listing {
    std::optional<output_slice> match_outputs(const tx_output_list &outputs, const int64_t offset, const size_t num_outputs)
    {
        if (offset < 0) [[unlikely]]
            return {};
        const auto start = static_cast<uint64_t>(offset);
        if (start > outputs.size() || outputs.size() - start < num_outputs)
            return {};
        return output_slice { outputs }.subspan(start, num_outputs);
    }

    std::optional<uint64_t> verify_payouts(const output_slice outputs, const payout_list &payouts, const datum_option_t &tag, const tag_rule rule)
    {
        if (outputs.size() != payouts.size()) [[unlikely]]
            return {};
        uint64_t sum = 0;
        for (size_t i = 0; i < payouts.size(); ++i) {
            const auto &out = outputs[i];
            const auto &p = payouts[i];
            if (out.addr != p.destination || out.coin < p.amount)
                return {};
            if ((rule == tag_rule::required || out.datum) && !carries_tag(out.datum, tag))
                return {};
            if (p.amount > std::numeric_limits<uint64_t>::max() - sum) [[unlikely]]
                return {};
            sum += p.amount;
        }
        return sum;
    }
}
