/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_BLAKE2B_HPP
#define LISTING_GUARD_BLAKE2B_HPP

#include <lg/array.hpp>
#include <lg/common/bytes.hpp>

namespace listing_guard {
    using blake2b_224_hash = byte_array<28>;
    using blake2b_256_hash = byte_array<32>;

    extern void blake2b_sodium(void *out, size_t out_len, const void *in, size_t in_len);

    inline void blake2b(const std::span<uint8_t> &out, const buffer &in)
    {
        blake2b_sodium(out.data(), out.size(), in.data(), in.size());
    }

    template<typename T>
    T blake2b(const buffer &in)
    {
        T out;
        blake2b_sodium(out.data(), out.size(), in.data(), in.size());
        return out;
    }
}

#endif // !LISTING_GUARD_BLAKE2B_HPP
