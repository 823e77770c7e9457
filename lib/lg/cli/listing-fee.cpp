/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/cli.hpp>
#include <lg/listing/fee.hpp>

namespace listing_guard::cli::listing_fee {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "listing-fee";
            cmd.desc = "print the marketplace fee demanded for a given sum of payouts in lovelace";
            cmd.args.expect({ "<payouts-sum>" });
        }

        void run(const arguments &args, const options &) const override
        {
            const auto payouts_sum = json::uint(json::value(std::string_view { args.at(0) }));
            const auto fee = listing::marketplace_fee(payouts_sum);
            if (!fee)
                throw error(fmt::format("the payouts sum {} is too large to compute a fee", payouts_sum));
            std::cout << fmt::format("{}\n", *fee);
            logger::debug("payouts sum: {} fee: {}", payouts_sum, *fee);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
