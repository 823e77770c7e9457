/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/cli.hpp>
#include <lg/listing/datum-tag.hpp>

namespace listing_guard::cli::listing_datum_tag {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "listing-datum-tag";
            cmd.desc = "print the inline datum that outputs paying for the listing locked at <tx-hash>#<index> must carry";
            cmd.args.expect({ "<tx-hash>", "<index>" });
        }

        void run(const arguments &args, const options &) const override
        {
            const cardano::tx_out_ref ref { cardano::tx_hash::from_hex(args.at(0)), json::uint(json::value(std::string_view { args.at(1) })) };
            const auto tag = listing::datum_tag(ref);
            std::cout << fmt::format("hash: {}\ninline datum: {}\n", listing::datum_tag_hash(ref), std::get<uint8_vector>(tag.val));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
