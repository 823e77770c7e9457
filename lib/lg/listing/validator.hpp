/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_LISTING_VALIDATOR_HPP
#define LISTING_GUARD_LISTING_VALIDATOR_HPP

#include <lg/listing/types.hpp>

namespace listing_guard::listing {
    struct verdict {
        reject_reason reason = reject_reason::none;

        bool accepted() const noexcept
        {
            return reason == reject_reason::none;
        }
    };

    /*
     * Decides whether a transaction spending a listing's locked output is permitted.
     * Holds only the immutable deploy-time configuration, so a single instance can serve
     * any number of concurrent validations.
     */
    struct validator {
        explicit validator(validator_config cfg);

        // The only outcome visible on-chain: true permits the transaction, false rejects it.
        bool validate(const listing_datum &datum, const redeemer &r, const tx_context &ctx) const;
        // Same decision but keeps the reason of a rejection for off-chain diagnostics.
        verdict evaluate(const listing_datum &datum, const redeemer &r, const tx_context &ctx) const;

        const validator_config &cfg() const noexcept
        {
            return _cfg;
        }
    private:
        const validator_config _cfg;

        verdict _buy(const listing_datum &datum, const buy &b, const tx_context &ctx) const;
        verdict _buy_discounted(const listing_datum &datum, int64_t offset, const datum_option_t &tag, const tx_context &ctx) const;
        verdict _buy_with_fee(const listing_datum &datum, int64_t offset, const datum_option_t &tag, const tx_context &ctx) const;
        verdict _withdraw_or_update(const listing_datum &datum, const tx_context &ctx) const;
    };
}

namespace fmt {
    template<>
    struct formatter<listing_guard::listing::verdict>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v.accepted())
                return fmt::format_to(ctx.out(), "accepted");
            return fmt::format_to(ctx.out(), "rejected: {}", v.reason);
        }
    };
}

#endif // !LISTING_GUARD_LISTING_VALIDATOR_HPP
