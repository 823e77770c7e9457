/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/common/test.hpp>
#include <lg/listing/mocks.hpp>
#include <lg/listing/validator.hpp>

using namespace listing_guard;
using namespace listing_guard::listing;

namespace {
    json::value parse(const std::string_view s)
    {
        return json::parse(s);
    }
}

suite listing_types_suite = [] {
    "listing::types"_test = [] {
        "redeemer"_test = [] {
            const auto b = redeemer_from_json(parse(R"({ "type": "buy", "payoutOutputsOffset": 3 })"));
            expect(fatal(std::holds_alternative<buy>(b)));
            test_same(3, std::get<buy>(b).payout_outputs_offset);
            const auto neg = redeemer_from_json(parse(R"({ "type": "buy", "payoutOutputsOffset": -2 })"));
            test_same(-2, std::get<buy>(neg).payout_outputs_offset);
            expect(std::holds_alternative<withdraw_or_update>(redeemer_from_json(parse(R"({ "type": "withdrawOrUpdate" })"))));
            expect(throws([] { redeemer_from_json(parse(R"({ "type": "update" })")); }));
            expect(throws([] { redeemer_from_json(parse(R"({ "type": "buy" })")); }));
            expect(throws([] { redeemer_from_json(parse(R"({ "type": "buy", "payoutOutputsOffset": 1.5 })")); }));
            test_same(std::string { "buy with payout outputs offset 3" }, fmt::format("{}", b));
        };
        "listing_datum"_test = [] {
            const auto datum = listing_datum::from_json(parse(R"({
                "owner": { "hash": "A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1", "script": false },
                "payouts": [ { "address": { "payment": "keyHash-10101010101010101010101010101010101010101010101010101010" }, "amount": 100 } ]
            })"));
            expect(datum.owner == mocks::key_cred(0xA1));
            expect(fatal(datum.payouts.size() == 1_ull));
            test_same(100, datum.payouts[0].amount);
            expect(!datum.payouts[0].destination.stake);
            expect(throws([] { listing_datum::from_json(parse(R"({ "payouts": [] })")); }));
        };
        "tx_context"_test = [] {
            const auto ctx = tx_context::from_json(parse(R"({
                "purpose": { "type": "certify", "certIdx": 0 },
                "outputs": [],
                "extraSignatories": [ "A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1", "A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1" ],
                "withdrawals": [ { "stake": "scriptHash-FEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFE", "amount": "0" } ]
            })"));
            test_same(1, ctx.extra_signatories.size());
            expect(ctx.extra_signatories.contains(mocks::authorizer()));
            expect(ctx.withdrawals.contains(mocks::script_cred(0xFE)));
            expect(std::holds_alternative<purpose_certify>(ctx.purpose));
            const auto minimal = tx_context::from_json(parse(R"({ "purpose": { "type": "certify", "certIdx": 0 }, "outputs": [] })"));
            expect(minimal.extra_signatories.empty());
            expect(minimal.withdrawals.empty());
        };
        "tx_context duplicate withdrawals"_test = [] {
            expect(throws([] {
                tx_context::from_json(parse(R"({
                    "purpose": { "type": "certify", "certIdx": 0 },
                    "outputs": [],
                    "withdrawals": [
                        { "stake": "scriptHash-FEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFE", "amount": 0 },
                        { "stake": "scriptHash-FEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFE", "amount": 5 }
                    ]
                })"));
            }));
        };
        "validator_config"_test = [] {
            const auto cfg = validator_config::from_json(parse(R"({
                "authorizers": [ "A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1" ],
                "feeAddress": {
                    "payment": "scriptHash-FEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFEFE",
                    "stake": "keyHash-FDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFDFD"
                }
            })").as_object());
            const auto expected = mocks::config();
            expect(cfg.authorizers == expected.authorizers);
            expect(cfg.fee_address == expected.fee_address);
            expect(throws([] { validator_config::from_json(parse(R"({ "authorizers": [] })").as_object()); }));
        };
        "reject_reason format"_test = [] {
            test_same(std::string { "owner_withdrawal_missing" }, fmt::format("{}", reject_reason::owner_withdrawal_missing));
            expect(throws([] { static_cast<void>(fmt::format("{}", static_cast<reject_reason>(200))); }));
        };
        "decoded requests"_test = [] {
            const config_file cfg { "./etc/listing/validator.json" };
            const validator v { validator_config::from_config(cfg) };
            for (const auto *path: { "./data/listing/buy-with-fee.json", "./data/listing/cancel-delegated.json" }) {
                const auto j_req = json::load(path);
                const auto &req = j_req.as_object();
                const auto datum = listing_datum::from_json(req.at("datum"));
                const auto r = redeemer_from_json(req.at("redeemer"));
                const auto ctx = tx_context::from_json(req.at("context"));
                test_same(path, reject_reason::none, v.evaluate(datum, r, ctx).reason);
                // dropping the fee output must reject the purchase
                if (std::holds_alternative<buy>(r)) {
                    auto no_fee = ctx;
                    no_fee.outputs.erase(no_fee.outputs.begin() + 1);
                    expect(!v.validate(datum, buy { 1 }, no_fee));
                }
            }
        };
    };
};
