/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

extern "C" {
#   include <sodium.h>
}
#include <lg/blake2b.hpp>

namespace listing_guard {
    static_assert(sizeof(blake2b_256_hash) == crypto_generichash_BYTES);

    static void ensure_sodium_initialized()
    {
        static const int init_res = sodium_init();
        if (init_res < 0) [[unlikely]]
            throw error("libsodium initialization has failed!");
    }

    void blake2b_sodium(void *out, const size_t out_len, const void *in, const size_t in_len)
    {
        ensure_sodium_initialized();
        if (crypto_generichash(reinterpret_cast<unsigned char*>(out), out_len, reinterpret_cast<const unsigned char *>(in), in_len, nullptr, 0) != 0)
            throw error("libsodium error: can't compute hash!");
    }
}
