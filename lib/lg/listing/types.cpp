/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/listing/types.hpp>

namespace listing_guard::listing {
    payout payout::from_json(const json::value &j)
    {
        const auto &o = j.as_object();
        return { address::from_json(o.at("address")), json::uint(o.at("amount")) };
    }

    listing_datum listing_datum::from_json(const json::value &j)
    {
        const auto &o = j.as_object();
        listing_datum d { .owner=credential_t::from_json(o.at("owner")) };
        for (const auto &p: o.at("payouts").as_array())
            d.payouts.emplace_back(payout::from_json(p));
        return d;
    }

    redeemer redeemer_from_json(const json::value &j)
    {
        const auto &o = j.as_object();
        const auto typ = static_cast<std::string_view>(o.at("type").as_string());
        if (typ == "buy")
            return buy { o.at("payoutOutputsOffset").to_number<int64_t>() };
        if (typ == "withdrawOrUpdate")
            return withdraw_or_update {};
        throw error(fmt::format("unsupported redeemer type: {}", typ));
    }

    tx_context tx_context::from_json(const json::value &j)
    {
        const auto &o = j.as_object();
        tx_context ctx { .purpose=script_purpose_from_json(o.at("purpose")) };
        for (const auto &out: o.at("outputs").as_array())
            ctx.outputs.emplace_back(tx_output::from_json(out));
        if (const auto *sigs = o.if_contains("extraSignatories"); sigs) {
            for (const auto &vk: sigs->as_array())
                ctx.extra_signatories.emplace(json::hex_array<28>(vk));
        }
        if (const auto *withdrawals = o.if_contains("withdrawals"); withdrawals) {
            for (const auto &w: withdrawals->as_array()) {
                const auto &wo = w.as_object();
                const auto [it, created] = ctx.withdrawals.try_emplace(credential_t::from_json(wo.at("stake")), json::uint(wo.at("amount")));
                if (!created) [[unlikely]]
                    throw error(fmt::format("duplicate withdrawal for {}", it->first));
            }
        }
        return ctx;
    }

    validator_config validator_config::from_json(const json::object &o)
    {
        validator_config cfg { .fee_address=address::from_json(o.at("feeAddress")) };
        for (const auto &vk: o.at("authorizers").as_array())
            cfg.authorizers.emplace(json::hex_array<28>(vk));
        return cfg;
    }
}
