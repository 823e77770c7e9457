/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <lg/config.hpp>
#include <lg/logger.hpp>

namespace listing_guard {
    const json::value &config_json::_at_impl(const std::string_view &name) const
    {
        const auto it = _json.find(name);
        if (it == _json.end())
            throw error(fmt::format("config does not have the requested {} element!", name));
        return it->value();
    }

    std::string config_file::default_path()
    {
        if (const char *env_path = std::getenv("LG_CONFIG"); env_path)
            return env_path;
        return "etc/listing/validator.json";
    }

    config_file::config_file(const std::string &path)
        : _path { path }
    {
        auto parsed = json::load(path);
        if (!parsed.is_object())
            throw error(fmt::format("configuration file {} must contain a JSON object!", path));
        _parsed = std::move(parsed.as_object());
        logger::debug("loaded configuration from {}", path);
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file {} does not have the element {}!", _path, name));
        return it->value();
    }
}
