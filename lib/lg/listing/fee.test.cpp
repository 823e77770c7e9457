/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <lg/common/test.hpp>
#include <lg/listing/fee.hpp>
#include <lg/listing/mocks.hpp>

using namespace listing_guard;
using namespace listing_guard::listing;

suite listing_fee_suite = [] {
    "listing::fee"_test = [] {
        "marketplace_fee"_test = [] {
            test_same(100'000'000, marketplace_fee(4'900'000'000).value());
            test_same(2, marketplace_fee(100).value());
            test_same(0, marketplace_fee(0).value());
            test_same(0, marketplace_fee(48).value());
            test_same(1, marketplace_fee(49).value());
            test_same(20'408, marketplace_fee(1'000'000).value());
            test_same(40'816, marketplace_fee(2'000'000).value());
            test_same(204'081, marketplace_fee(10'000'000).value());
            test_same(2'040'816'326, marketplace_fee(100'000'000'000).value());
        };
        "truncation order"_test = [] {
            // multiplying first keeps the nested floors equal to payouts_sum / 49,
            // dividing first would demand nothing for payouts below 50 lovelace
            test_same(1, marketplace_fee(49).value());
            test_same(0, 49 / 50 * 50 / 49);
            test_same(2, marketplace_fee(98).value());
            test_same(3, marketplace_fee(147).value());
            for (uint64_t sum = 0; sum < 10'000; ++sum)
                expect(marketplace_fee(sum).value() == sum / 49) << sum;
        };
        "error bound"_test = [] {
            // the fee approximates payouts_sum / 49 within 40,000 lovelace up to 100,000 ADA
            static constexpr uint64_t max_sum = 100'000'000'000;
            for (uint64_t sum = 0; sum <= max_sum; sum += 999'999'937) {
                const auto fee = marketplace_fee(sum).value();
                const auto exact = sum / 49;
                expect(fee <= exact + 1 && fee + 40'000 > exact) << sum << fee;
            }
            const auto fee = marketplace_fee(max_sum).value();
            expect(fee + 40'000 > max_sum / 49);
        };
        "overflow"_test = [] {
            constexpr auto max = std::numeric_limits<uint64_t>::max();
            expect(!marketplace_fee(max));
            expect(!marketplace_fee(max / 50 + 1));
            expect(marketplace_fee(max / 50).has_value());
        };
        "verify_fee_output"_test = [] {
            const auto tag = datum_tag(mocks::spent_ref(0));
            const auto fee_addr = mocks::fee_address();
            expect(verify_fee_output(mocks::output(fee_addr, 2, tag), 2, fee_addr, tag));
            expect(verify_fee_output(mocks::output(fee_addr, 3, tag), 2, fee_addr, tag));
            expect(!verify_fee_output(mocks::output(fee_addr, 1, tag), 2, fee_addr, tag));
            expect(!verify_fee_output(mocks::output(mocks::addr(7), 2, tag), 2, fee_addr, tag));
            expect(!verify_fee_output(mocks::output(fee_addr, 2), 2, fee_addr, tag));
            expect(!verify_fee_output(mocks::output(fee_addr, 2, datum_tag(mocks::spent_ref(1))), 2, fee_addr, tag));
            expect(verify_fee_output(mocks::output(fee_addr, 0, tag), 0, fee_addr, tag));
        };
        "verify_fee_output with a non-minimal tag encoding"_test = [] {
            const auto tag = datum_tag(mocks::spent_ref(0));
            const auto fee_addr = mocks::fee_address();
            const datum_option_t long_form { uint8_vector::from_hex("5A00000020D111C8F47DC7FA141CE41B8717ADDAB0FFA7E1315564071A6DBFE1E948A1A140") };
            expect(verify_fee_output(mocks::output(fee_addr, 2, long_form), 2, fee_addr, tag));
            const datum_option_t truncated { uint8_vector::from_hex("5A00000021D111C8F47DC7FA141CE41B8717ADDAB0FFA7E1315564071A6DBFE1E948A1A140") };
            expect(!verify_fee_output(mocks::output(fee_addr, 2, truncated), 2, fee_addr, tag));
        };
    };
};
