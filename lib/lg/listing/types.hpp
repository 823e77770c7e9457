/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_LISTING_TYPES_HPP
#define LISTING_GUARD_LISTING_TYPES_HPP

#include <variant>
#include <lg/cardano/types.hpp>
#include <lg/config.hpp>

namespace listing_guard::listing {
    using namespace cardano;

    struct payout {
        cardano::address destination {};
        uint64_t amount = 0;

        static payout from_json(const json::value &);
    };
    using payout_list = vector<payout>;

    // The terms attached to the locked output of a listing. Immutable once the listing is created.
    struct listing_datum {
        payout_list payouts {};
        credential_t owner {};

        static listing_datum from_json(const json::value &);
    };

    struct buy {
        // the index of the first output paying this listing's payouts
        int64_t payout_outputs_offset = 0;
    };

    struct withdraw_or_update {
    };

    using redeemer = std::variant<buy, withdraw_or_update>;
    extern redeemer redeemer_from_json(const json::value &);

    struct tx_context {
        tx_output_list outputs {};
        key_hash_set extra_signatories {};
        withdrawal_map withdrawals {};
        script_purpose purpose {};

        static tx_context from_json(const json::value &);
    };

    // Deploy-time parameters of a validator instance
    struct validator_config {
        key_hash_set authorizers {};
        cardano::address fee_address {};

        static validator_config from_json(const json::object &);

        static validator_config from_config(const config &cfg)
        {
            return from_json(cfg.json());
        }
    };

    enum class reject_reason: uint8_t {
        none,
        not_a_spend,
        outputs_out_of_range,
        payout_mismatch,
        non_positive_payouts,
        fee_mismatch,
        amount_overflow,
        owner_signature_missing,
        owner_withdrawal_missing
    };
}

namespace fmt {
    template<>
    struct formatter<listing_guard::listing::payout>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{} lovelace to ({})", v.amount, v.destination);
        }
    };

    template<>
    struct formatter<listing_guard::listing::listing_datum>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "owner: {} payouts: {}", v.owner, v.payouts);
        }
    };

    template<>
    struct formatter<listing_guard::listing::redeemer>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace listing_guard::listing;
            if (const auto *b = std::get_if<buy>(&v); b)
                return fmt::format_to(ctx.out(), "buy with payout outputs offset {}", b->payout_outputs_offset);
            return fmt::format_to(ctx.out(), "withdraw or update");
        }
    };

    template<>
    struct formatter<listing_guard::listing::reject_reason>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using listing_guard::listing::reject_reason;
            switch (v) {
                case reject_reason::none: return fmt::format_to(ctx.out(), "none");
                case reject_reason::not_a_spend: return fmt::format_to(ctx.out(), "not_a_spend");
                case reject_reason::outputs_out_of_range: return fmt::format_to(ctx.out(), "outputs_out_of_range");
                case reject_reason::payout_mismatch: return fmt::format_to(ctx.out(), "payout_mismatch");
                case reject_reason::non_positive_payouts: return fmt::format_to(ctx.out(), "non_positive_payouts");
                case reject_reason::fee_mismatch: return fmt::format_to(ctx.out(), "fee_mismatch");
                case reject_reason::amount_overflow: return fmt::format_to(ctx.out(), "amount_overflow");
                case reject_reason::owner_signature_missing: return fmt::format_to(ctx.out(), "owner_signature_missing");
                case reject_reason::owner_withdrawal_missing: return fmt::format_to(ctx.out(), "owner_withdrawal_missing");
                default: throw listing_guard::error(fmt::format("unsupported reject_reason value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !LISTING_GUARD_LISTING_TYPES_HPP
