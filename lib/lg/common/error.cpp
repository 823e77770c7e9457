/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cerrno>
#include <cstring>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"
#include <lg/logger.hpp>

namespace listing_guard {
    error::error(const std::string_view msg):
        _msg { msg }
    {
        // skips the frames of safe_dump_to and of this constructor
        boost::stacktrace::safe_dump_to(2, _trace.data(), _trace.size());
    }

    std::string error::stacktrace() const
    {
        std::array<char, 0x2000> buf {};
        // the last byte stays zero and terminates the string even when the trace does not fit
        boost::interprocess::obufferstream os { buf.data(), buf.size() - 1 };
        os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
        return buf.data();
    }

    const char *error::what() const noexcept
    {
        if (logger::tracing_enabled()) {
            try {
                logger::trace("{} thrown at:\n{}", _msg, stacktrace());
            } catch (const std::exception &) {
                // what() is noexcept, the message is returned without the trace
            }
        }
        return _msg.c_str();
    }

    error_sys::error_sys(const std::string_view msg)
        : error { fmt::format("{} errno: {} strerror: {}", msg, errno, std::strerror(errno)) }
    {
    }
}
