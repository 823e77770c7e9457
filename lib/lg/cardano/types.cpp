/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/cardano/types.hpp>

namespace listing_guard::cardano {
    credential_t credential_t::from_json(const std::string_view s)
    {
        const auto pos = s.find('-');
        if (pos == std::string::npos) [[unlikely]]
            throw error(fmt::format("invalid credential format: {}", s));
        const auto typ = s.substr(0, pos);
        const auto hex = s.substr(pos + 1);
        bool script;
        if (typ == "keyHash") {
            script = false;
        } else if (typ == "scriptHash") {
            script = true;
        } else {
            throw error(fmt::format("invalid credential format: {}", s));
        }
        return { key_hash::from_hex(hex), script };
    }

    credential_t credential_t::from_json(const json::value &j)
    {
        if (j.is_string())
            return from_json(static_cast<std::string_view>(j.as_string()));
        const auto &o = j.as_object();
        return { json::hex_array<28>(o.at("hash")), o.at("script").as_bool() };
    }

    address address::from_json(const json::value &j)
    {
        const auto &o = j.as_object();
        address addr { credential_t::from_json(o.at("payment")) };
        if (const auto *stake = o.if_contains("stake"); stake && !stake->is_null())
            addr.stake.emplace(credential_t::from_json(*stake));
        return addr;
    }

    tx_out_ref tx_out_ref::from_json(const json::value &j)
    {
        const auto &o = j.as_object();
        return { json::hex_array<32>(o.at("hash")), json::uint(o.at("idx")) };
    }

    datum_option_t datum_option_t::from_json(const json::value &j)
    {
        const auto &o = j.as_object();
        if (const auto *hash = o.if_contains("hash"); hash)
            return { json::hex_array<32>(*hash) };
        if (const auto *inl = o.if_contains("inline"); inl)
            return { json::hex_bytes(*inl) };
        throw error(fmt::format("a datum option must contain either hash or inline: {}", json::serialize(j)));
    }

    tx_output tx_output::from_json(const json::value &j)
    {
        const auto &o = j.as_object();
        tx_output out { address::from_json(o.at("address")), json::uint(o.at("coin")) };
        if (const auto *datum = o.if_contains("datum"); datum && !datum->is_null())
            out.datum.emplace(datum_option_t::from_json(*datum));
        return out;
    }

    script_purpose script_purpose_from_json(const json::value &j)
    {
        const auto &o = j.as_object();
        const auto typ = static_cast<std::string_view>(o.at("type").as_string());
        if (typ == "spend")
            return purpose_spend { tx_out_ref::from_json(o.at("outRef")) };
        if (typ == "mint")
            return purpose_mint { json::hex_array<28>(o.at("policy")) };
        if (typ == "reward")
            return purpose_reward { credential_t::from_json(o.at("stake")) };
        if (typ == "certify")
            return purpose_certify { json::uint(o.at("certIdx")) };
        throw error(fmt::format("unsupported script purpose type: {}", typ));
    }
}
