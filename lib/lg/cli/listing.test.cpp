/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sstream>
#include <lg/cli.hpp>
#include <lg/common/test.hpp>

using namespace listing_guard;

namespace {
    struct run_result {
        int exit_code;
        std::string out;
    };

    struct cout_capture {
        cout_capture(): _orig { std::cout.rdbuf(_out.rdbuf()) }
        {
        }

        ~cout_capture()
        {
            std::cout.rdbuf(_orig);
        }

        std::string str() const
        {
            return _out.str();
        }
    private:
        std::ostringstream _out {};
        std::streambuf *_orig;
    };

    run_result run_command(const std::initializer_list<const char *> args)
    {
        std::vector<const char *> argv { "lg" };
        argv.insert(argv.end(), args.begin(), args.end());
        const cout_capture out {};
        const auto exit_code = cli::run(static_cast<int>(argv.size()), argv.data());
        return { exit_code, out.str() };
    }
}

suite cli_listing_suite = [] {
    "cli::listing"_test = [] {
        "listing-validate"_test = [] {
            test_same(0, run_command({ "listing-validate", "./data/listing/buy-with-fee.json" }).exit_code);
            test_same(0, run_command({ "listing-validate", "./data/listing/cancel-delegated.json" }).exit_code);
            test_same(0, run_command({ "listing-validate", "--config=./etc/listing/validator.json", "./data/listing/buy-with-fee.json" }).exit_code);
        };
        "listing-validate rejects"_test = [] {
            test_same(1, run_command({ "listing-validate", "./data/listing/buy-underpaid-fee.json" }).exit_code);
            test_same(1, run_command({ "listing-validate", "./data/listing/not-an-object.json" }).exit_code);
            test_same(1, run_command({ "listing-validate", "./data/listing/missing.json" }).exit_code);
            test_same(1, run_command({ "listing-validate", "--config=./data/listing/not-an-object.json", "./data/listing/buy-with-fee.json" }).exit_code);
            test_same(1, run_command({ "listing-validate" }).exit_code);
        };
        "listing-fee"_test = [] {
            {
                const auto res = run_command({ "listing-fee", "100" });
                test_same(0, res.exit_code);
                test_same(std::string { "2\n" }, res.out);
            }
            {
                const auto res = run_command({ "listing-fee", "10000000" });
                test_same(0, res.exit_code);
                test_same(std::string { "204081\n" }, res.out);
            }
            test_same(1, run_command({ "listing-fee", "18446744073709551615" }).exit_code);
            test_same(1, run_command({ "listing-fee", "18446744073709551616" }).exit_code);
            test_same(1, run_command({ "listing-fee", "-1" }).exit_code);
        };
        "listing-datum-tag"_test = [] {
            const auto res = run_command({ "listing-datum-tag", "0123456789ABCDEF0123456789ABCDEF0123456789ABCDEF0123456789ABCDEF", "0" });
            test_same(0, res.exit_code);
            test_same(std::string {
                "hash: D111C8F47DC7FA141CE41B8717ADDAB0FFA7E1315564071A6DBFE1E948A1A140\n"
                "inline datum: 5820D111C8F47DC7FA141CE41B8717ADDAB0FFA7E1315564071A6DBFE1E948A1A140\n"
            }, res.out);
            test_same(1, run_command({ "listing-datum-tag", "0123", "0" }).exit_code);
        };
    };
};
