/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_CARDANO_TYPES_HPP
#define LISTING_GUARD_CARDANO_TYPES_HPP

#include <optional>
#include <variant>
#include <lg/blake2b.hpp>
#include <lg/container.hpp>
#include <lg/json.hpp>

namespace listing_guard::cardano {
    using key_hash = blake2b_224_hash;
    using script_hash = blake2b_224_hash;
    using policy_id = blake2b_224_hash;
    using tx_hash = blake2b_256_hash;
    using datum_hash = blake2b_256_hash;
    using tx_out_idx = uint64_t;

    struct credential_t {
        key_hash hash {};
        bool script { false };

        static credential_t from_json(std::string_view);
        static credential_t from_json(const json::value &);

        std::strong_ordering operator<=>(const credential_t &o) const noexcept
        {
            if (const auto cmp = static_cast<buffer>(hash) <=> static_cast<buffer>(o.hash); cmp != 0)
                return cmp;
            return script <=> o.script;
        }

        bool operator==(const credential_t &o) const noexcept
        {
            return hash == o.hash && script == o.script;
        }
    };
    using stake_ident = credential_t;

    // Pointer stake references are not supported since they cannot be resolved without the ledger state
    struct address {
        credential_t payment {};
        std::optional<stake_ident> stake {};

        static address from_json(const json::value &);

        bool operator==(const address &o) const noexcept
        {
            return payment == o.payment && stake == o.stake;
        }
    };

    struct tx_out_ref {
        tx_hash hash {};
        tx_out_idx idx {};

        static tx_out_ref from_json(const json::value &);

        std::strong_ordering operator<=>(const tx_out_ref &o) const noexcept
        {
            if (const auto cmp = static_cast<buffer>(hash) <=> static_cast<buffer>(o.hash); cmp != 0)
                return cmp;
            return idx <=> o.idx;
        }

        bool operator==(const tx_out_ref &o) const noexcept
        {
            return hash == o.hash && idx == o.idx;
        }
    };

    // Either a hash of the datum or the CBOR of an inline datum
    struct datum_option_t {
        using value_type = std::variant<datum_hash, uint8_vector>;

        value_type val;

        static datum_option_t from_json(const json::value &);

        bool is_inline() const noexcept
        {
            return std::holds_alternative<uint8_vector>(val);
        }

        bool operator==(const datum_option_t &o) const
        {
            return val == o.val;
        }
    };

    struct tx_output {
        cardano::address addr {};
        uint64_t coin = 0;
        std::optional<datum_option_t> datum {};

        static tx_output from_json(const json::value &);
    };
    using tx_output_list = vector<tx_output>;

    struct purpose_spend {
        tx_out_ref out_ref {};
    };

    struct purpose_mint {
        policy_id policy {};
    };

    struct purpose_reward {
        stake_ident stake {};
    };

    struct purpose_certify {
        uint64_t cert_idx = 0;
    };

    using script_purpose = std::variant<purpose_spend, purpose_mint, purpose_reward, purpose_certify>;
    extern script_purpose script_purpose_from_json(const json::value &);

    using key_hash_set = flat_set<key_hash>;
    using withdrawal_map = flat_map<stake_ident, uint64_t>;
}

namespace fmt {
    template<>
    struct formatter<listing_guard::cardano::credential_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}-{}", v.script ? "scriptHash" : "keyHash", v.hash);
        }
    };

    template<>
    struct formatter<listing_guard::cardano::address>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v.stake)
                return fmt::format_to(ctx.out(), "payment: {} stake: {}", v.payment, *v.stake);
            return fmt::format_to(ctx.out(), "payment: {}", v.payment);
        }
    };

    template<>
    struct formatter<listing_guard::cardano::tx_out_ref>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}#{}", v.hash, v.idx);
        }
    };

    template<>
    struct formatter<listing_guard::cardano::datum_option_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (const auto *hash = std::get_if<listing_guard::cardano::datum_hash>(&v.val); hash)
                return fmt::format_to(ctx.out(), "datum-hash: {}", *hash);
            return fmt::format_to(ctx.out(), "inline-datum: {}", std::get<listing_guard::uint8_vector>(v.val));
        }
    };

    template<>
    struct formatter<listing_guard::cardano::tx_output>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "address: ({}) coin: {} datum: {}", v.addr, v.coin, v.datum);
        }
    };

    template<>
    struct formatter<listing_guard::cardano::script_purpose>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace listing_guard::cardano;
            return std::visit([&](const auto &p) {
                using T = std::decay_t<decltype(p)>;
                if constexpr (std::is_same_v<T, purpose_spend>)
                    return fmt::format_to(ctx.out(), "spend {}", p.out_ref);
                else if constexpr (std::is_same_v<T, purpose_mint>)
                    return fmt::format_to(ctx.out(), "mint {}", p.policy);
                else if constexpr (std::is_same_v<T, purpose_reward>)
                    return fmt::format_to(ctx.out(), "reward {}", p.stake);
                else
                    return fmt::format_to(ctx.out(), "certify #{}", p.cert_idx);
            }, v);
        }
    };
}

#endif // !LISTING_GUARD_CARDANO_TYPES_HPP
