/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LISTING_GUARD_TIMER_HPP
#define LISTING_GUARD_TIMER_HPP

#include <chrono>
#include <exception>
#include <lg/logger.hpp>

namespace listing_guard {
    struct timer {
        explicit timer(const std::string_view &title, const logger::level lev=logger::level::trace)
            : _title { title }, _level { lev }, _start_time { std::chrono::steady_clock::now() }
        {
            if (logger::tracing_enabled())
                logger::log(_level, "timer '{}' created", _title);
        }

        ~timer()
        {
            if (std::uncaught_exceptions() == 0)
                logger::log(_level, "{} took {:0.3f} secs", _title, duration());
            else
                logger::log(_level, "{} failed after {:0.3f} secs", _title, duration());
        }

        double duration() const
        {
            const std::chrono::duration<double> elapsed_seconds = std::chrono::steady_clock::now() - _start_time;
            return elapsed_seconds.count();
        }
    private:
        const std::string _title;
        const logger::level _level;
        const std::chrono::time_point<std::chrono::steady_clock> _start_time;
    };
}

#endif // !LISTING_GUARD_TIMER_HPP
