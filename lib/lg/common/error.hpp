/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_COMMON_ERROR_HPP
#define LISTING_GUARD_COMMON_ERROR_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace listing_guard {
    // Remembers the call stack of the throw site so that it can be rendered when the error is reported
    struct error: std::exception {
        explicit error(std::string_view msg);
        const char *what() const noexcept override;
        std::string stacktrace() const;
    private:
        static constexpr size_t max_frames = 0x20;

        std::string _msg;
        std::array<std::byte, sizeof(void*) * max_frames> _trace {};
    };

    // Appends errno and its description to the message
    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}

#endif // !LISTING_GUARD_COMMON_ERROR_HPP
