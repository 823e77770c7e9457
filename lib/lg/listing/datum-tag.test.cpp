/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/common/test.hpp>
#include <lg/listing/datum-tag.hpp>
#include <lg/listing/mocks.hpp>

using namespace listing_guard;
using namespace listing_guard::listing;

suite listing_datum_tag_suite = [] {
    "listing::datum_tag"_test = [] {
        "out_ref data"_test = [] {
            test_same(
                uint8_vector::from_hex("D8799FD8799F58200123456789ABCDEF0123456789ABCDEF0123456789ABCDEF0123456789ABCDEFFF00FF"),
                out_ref_data(mocks::spent_ref(0))
            );
        };
        "large index"_test = [] {
            const auto data = out_ref_data(mocks::spent_ref(300));
            test_same(uint8_vector::from_hex("FF19012CFF"), uint8_vector { buffer { data }.subbuf(data.size() - 5, 5) });
        };
        "tag hash"_test = [] {
            test_same(blake2b_256_hash::from_hex("D111C8F47DC7FA141CE41B8717ADDAB0FFA7E1315564071A6DBFE1E948A1A140"), datum_tag_hash(mocks::spent_ref(0)));
            test_same(blake2b_256_hash::from_hex("2DD4748A3580B53424E96EA087B5598C000127B6839E7CA577EC7D5653E7DA3D"), datum_tag_hash(mocks::spent_ref(1)));
        };
        "inline datum"_test = [] {
            const auto tag = datum_tag(mocks::spent_ref(0));
            expect(tag.is_inline());
            test_same(uint8_vector::from_hex("5820D111C8F47DC7FA141CE41B8717ADDAB0FFA7E1315564071A6DBFE1E948A1A140"), std::get<uint8_vector>(tag.val));
        };
        "carries_tag"_test = [] {
            const auto tag = datum_tag(mocks::spent_ref(0));
            const std::string hash_hex { "D111C8F47DC7FA141CE41B8717ADDAB0FFA7E1315564071A6DBFE1E948A1A140" };
            const auto inline_datum = [](const std::string &hex) {
                return std::optional<datum_option_t> { datum_option_t { uint8_vector::from_hex(hex) } };
            };
            expect(carries_tag(tag, tag));
            expect(carries_tag(inline_datum(fmt::format("5820{}", hash_hex)), tag));
            expect(carries_tag(inline_datum(fmt::format("590020{}", hash_hex)), tag));
            expect(carries_tag(inline_datum(fmt::format("5B0000000000000020{}", hash_hex)), tag));
            expect(carries_tag(inline_datum(fmt::format("5F5810{}5050{}FF", hash_hex.substr(0, 32), hash_hex.substr(32))), tag));
            expect(!carries_tag({}, tag));
            expect(!carries_tag(datum_tag(mocks::spent_ref(1)), tag));
            expect(!carries_tag(datum_option_t { datum_tag_hash(mocks::spent_ref(0)) }, tag));
            // trailing bytes, a missing break, a nested indefinite chunk, and a text string
            expect(!carries_tag(inline_datum(fmt::format("5820{}00", hash_hex)), tag));
            expect(!carries_tag(inline_datum(fmt::format("5F5820{}", hash_hex)), tag));
            expect(!carries_tag(inline_datum(fmt::format("5F5F5820{}FFFF", hash_hex)), tag));
            expect(!carries_tag(inline_datum(fmt::format("7820{}", hash_hex)), tag));
            expect(!carries_tag(inline_datum("5C"), tag));
            expect(!carries_tag(inline_datum(""), tag));
        };
        "distinct inputs have distinct tags"_test = [] {
            expect(datum_tag(mocks::spent_ref(0)) != datum_tag(mocks::spent_ref(1)));
            expect(datum_tag(mocks::spent_ref(1)) == datum_tag(mocks::spent_ref(1)));
        };
    };
};
