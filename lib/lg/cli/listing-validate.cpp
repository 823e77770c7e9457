/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/cli.hpp>
#include <lg/listing/validator.hpp>

namespace listing_guard::cli::listing_validate {
    using namespace listing_guard::listing;

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "listing-validate";
            cmd.desc = "decide whether a decoded listing spending request is permitted";
            cmd.args.expect({ "<request-path>" });
            cmd.opts.try_emplace("config", "a path to the validator configuration", config_file::default_path());
        }

        void run(const arguments &args, const options &opts) const override
        {
            const config_file cfg { opts.at("config").value() };
            const validator v { validator_config::from_config(cfg) };
            const auto j_req = json::load(args.at(0));
            const auto &req = j_req.as_object();
            const auto datum = listing_datum::from_json(req.at("datum"));
            const auto r = redeemer_from_json(req.at("redeemer"));
            const auto ctx = tx_context::from_json(req.at("context"));
            logger::debug("datum: {}", datum);
            logger::debug("redeemer: {} purpose: {}", r, ctx.purpose);
            logger::debug("outputs: {} signatories: {}", ctx.outputs.size(), ctx.extra_signatories);
            const auto res = v.evaluate(datum, r, ctx);
            logger::info("verdict: {}", res);
            if (!res.accepted())
                throw command_failed(fmt::format("the transaction is rejected: {}", res.reason));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
