/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdio>
#include <filesystem>
#include <lg/file.hpp>

namespace listing_guard::file {
    uint8_vector read(const std::string &path)
    {
        std::error_code ec {};
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) [[unlikely]]
            throw error(fmt::format("can't determine the size of {}: {}", path, ec.message()));
        uint8_vector buf(static_cast<size_t>(size));
        auto *f = std::fopen(path.c_str(), "rb");
        if (f == nullptr) [[unlikely]]
            throw error_sys(fmt::format("failed to open file for reading: {}", path));
        const auto num_read = buf.empty() ? 0 : std::fread(buf.data(), 1, buf.size(), f);
        std::fclose(f);
        if (num_read != buf.size()) [[unlikely]]
            throw error(fmt::format("could read only {} bytes out of {} from {}", num_read, buf.size(), path));
        return buf;
    }
}
