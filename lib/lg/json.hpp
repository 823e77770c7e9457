/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_JSON_HPP
#define LISTING_GUARD_JSON_HPP

#include <charconv>
#include <boost/json.hpp>
#include <lg/array.hpp>
#include <lg/file.hpp>

namespace listing_guard::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf.string_view(), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    template<size_t SZ>
    byte_array<SZ> hex_array(const json::value &v)
    {
        return byte_array<SZ>::from_hex(static_cast<std::string_view>(v.as_string()));
    }

    inline uint8_vector hex_bytes(const json::value &v)
    {
        return uint8_vector::from_hex(static_cast<std::string_view>(v.as_string()));
    }

    // Accepts both JSON numbers and decimal strings since amounts may exceed the double precision range.
    inline uint64_t uint(const json::value &v)
    {
        if (v.is_uint64())
            return v.as_uint64();
        if (v.is_int64()) {
            if (v.as_int64() < 0) [[unlikely]]
                throw error(fmt::format("expected a non-negative integer but got {}", v.as_int64()));
            return static_cast<uint64_t>(v.as_int64());
        }
        if (v.is_string()) {
            const auto s = static_cast<std::string_view>(v.as_string());
            if (s.empty() || s.find_first_not_of("0123456789") != std::string_view::npos) [[unlikely]]
                throw error(fmt::format("expected a decimal string but got '{}'", s));
            uint64_t res = 0;
            if (const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), res); ec != std::errc {} || ptr != s.data() + s.size()) [[unlikely]]
                throw error(fmt::format("the decimal string '{}' does not fit into 64 bits", s));
            return res;
        }
        throw error(fmt::format("expected an unsigned integer but got {}", json::serialize(v)));
    }
}

#endif // !LISTING_GUARD_JSON_HPP
