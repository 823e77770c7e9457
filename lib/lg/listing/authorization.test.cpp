/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/common/test.hpp>
#include <lg/listing/authorization.hpp>
#include <lg/listing/mocks.hpp>

using namespace listing_guard;
using namespace listing_guard::listing;

suite listing_authorization_suite = [] {
    "listing::authorization"_test = [] {
        "key owner"_test = [] {
            const auto owner = mocks::key_cred(0x11);
            auto ctx = mocks::spend_context({}, { mocks::key(0x22) });
            test_same(reject_reason::owner_signature_missing, owner_consents(owner, ctx));
            ctx.extra_signatories.emplace(owner.hash);
            test_same(reject_reason::none, owner_consents(owner, ctx));
        };
        "key owner cannot consent by a withdrawal"_test = [] {
            const auto owner = mocks::key_cred(0x11);
            auto ctx = mocks::spend_context({});
            ctx.withdrawals.emplace(owner, 0);
            test_same(reject_reason::owner_signature_missing, owner_consents(owner, ctx));
        };
        "script owner"_test = [] {
            const auto owner = mocks::script_cred(0x33);
            auto ctx = mocks::spend_context({});
            test_same(reject_reason::owner_withdrawal_missing, owner_consents(owner, ctx));
            ctx.withdrawals.emplace(owner, 0);
            test_same(reject_reason::none, owner_consents(owner, ctx));
        };
        "script owner with a non-zero withdrawal"_test = [] {
            const auto owner = mocks::script_cred(0x33);
            auto ctx = mocks::spend_context({});
            ctx.withdrawals.emplace(owner, 1'500'000);
            test_same(reject_reason::none, owner_consents(owner, ctx));
        };
        "script owner is not a signature"_test = [] {
            const auto owner = mocks::script_cred(0x33);
            auto ctx = mocks::spend_context({}, { owner.hash });
            // the key credential with the same hash is a different credential
            ctx.withdrawals.emplace(mocks::key_cred(0x33), 0);
            test_same(reject_reason::owner_withdrawal_missing, owner_consents(owner, ctx));
        };
        "has_any_signer"_test = [] {
            const key_hash_set authorizers { mocks::key(1), mocks::key(2) };
            expect(!has_any_signer(authorizers, {}));
            expect(!has_any_signer(authorizers, { mocks::key(3) }));
            expect(has_any_signer(authorizers, { mocks::key(3), mocks::key(2) }));
            expect(!has_any_signer({}, { mocks::key(1) }));
        };
    };
};
