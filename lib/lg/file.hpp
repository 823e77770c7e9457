/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_FILE_HPP
#define LISTING_GUARD_FILE_HPP

#include <string>
#include <lg/common/bytes.hpp>

namespace listing_guard::file {
    extern uint8_vector read(const std::string &path);
}

#endif // !LISTING_GUARD_FILE_HPP
