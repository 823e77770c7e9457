/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <lg/common/test.hpp>
#include <lg/config.hpp>

using namespace listing_guard;

suite config_suite = [] {
    "config"_test = [] {
        "config_json"_test = [] {
            auto j_cfg = json::parse(std::string_view { R"({ "authorizers": [], "name": "test" })" });
            const config_json cfg { std::move(j_cfg.as_object()) };
            expect(cfg.at("authorizers").as_array().empty());
            expect(cfg.at("name").as_string() == std::string_view { "test" });
            test_same(2, cfg.json().size());
            expect(throws([&] { static_cast<void>(cfg.at("feeAddress")); }));
        };
        "config_file"_test = [] {
            const config_file cfg { "./etc/listing/validator.json" };
            test_same(2, cfg.at("authorizers").as_array().size());
            expect(cfg.at("feeAddress").at("payment").as_string() == std::string_view { "scriptHash-84CC25EA4C29951D40B443B95BBC5676BC425470F96376D1984AF9AB" });
            expect(throws([&] { static_cast<void>(cfg.at("missing")); }));
        };
        "default_path"_test = [] {
            expect(std::getenv("LG_CONFIG") == nullptr);
            test_same(std::string { "etc/listing/validator.json" }, config_file::default_path());
            setenv("LG_CONFIG", "./etc-missing/validator.json", 1);
            test_same(std::string { "./etc-missing/validator.json" }, config_file::default_path());
            expect(throws([] { config_file cfg { config_file::default_path() }; }));
            unsetenv("LG_CONFIG");
            expect(std::getenv("LG_CONFIG") == nullptr);
        };
        "not an object"_test = [] {
            expect(throws([] { config_file cfg { "./data/listing/not-an-object.json" }; }));
        };
    };
};
