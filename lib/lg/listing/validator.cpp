/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/listing/authorization.hpp>
#include <lg/listing/datum-tag.hpp>
#include <lg/listing/fee.hpp>
#include <lg/listing/payouts.hpp>
#include <lg/listing/validator.hpp>

namespace listing_guard::listing {
    validator::validator(validator_config cfg): _cfg { std::move(cfg) }
    {
    }

    bool validator::validate(const listing_datum &datum, const redeemer &r, const tx_context &ctx) const
    {
        return evaluate(datum, r, ctx).accepted();
    }

    verdict validator::evaluate(const listing_datum &datum, const redeemer &r, const tx_context &ctx) const
    {
        return std::visit([&](const auto &req) {
            using T = std::decay_t<decltype(req)>;
            if constexpr (std::is_same_v<T, buy>) {
                return _buy(datum, req, ctx);
            } else if constexpr (std::is_same_v<T, withdraw_or_update>) {
                return _withdraw_or_update(datum, ctx);
            } else {
                static_assert(sizeof(T) == 0, "an unhandled redeemer type");
            }
        }, r);
    }

    verdict validator::_buy(const listing_datum &datum, const buy &b, const tx_context &ctx) const
    {
        const auto *spend = std::get_if<purpose_spend>(&ctx.purpose);
        if (!spend)
            return { reject_reason::not_a_spend };
        const auto tag = datum_tag(spend->out_ref);
        if (has_any_signer(_cfg.authorizers, ctx.extra_signatories))
            return _buy_discounted(datum, b.payout_outputs_offset, tag, ctx);
        return _buy_with_fee(datum, b.payout_outputs_offset, tag, ctx);
    }

    verdict validator::_buy_discounted(const listing_datum &datum, const int64_t offset, const datum_option_t &tag, const tx_context &ctx) const
    {
        const auto outputs = match_outputs(ctx.outputs, offset, datum.payouts.size());
        if (!outputs)
            return { reject_reason::outputs_out_of_range };
        const auto payouts_sum = verify_payouts(*outputs, datum.payouts, tag, tag_rule::required);
        if (!payouts_sum)
            return { reject_reason::payout_mismatch };
        if (*payouts_sum == 0)
            return { reject_reason::non_positive_payouts };
        return {};
    }

    verdict validator::_buy_with_fee(const listing_datum &datum, const int64_t offset, const datum_option_t &tag, const tx_context &ctx) const
    {
        // the fee output directly precedes the payout outputs
        const auto outputs = match_outputs(ctx.outputs, offset, datum.payouts.size() + 1);
        if (!outputs)
            return { reject_reason::outputs_out_of_range };
        // payout outputs of the fee path may go without a datum but never carry a foreign one
        const auto payouts_sum = verify_payouts(outputs->subspan(1), datum.payouts, tag, tag_rule::absent_or_tag);
        if (!payouts_sum)
            return { reject_reason::payout_mismatch };
        const auto fee = marketplace_fee(*payouts_sum);
        if (!fee)
            return { reject_reason::amount_overflow };
        if (!verify_fee_output(outputs->front(), *fee, _cfg.fee_address, tag))
            return { reject_reason::fee_mismatch };
        return {};
    }

    verdict validator::_withdraw_or_update(const listing_datum &datum, const tx_context &ctx) const
    {
        return { owner_consents(datum.owner, ctx) };
    }
}
