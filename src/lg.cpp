/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace listing_guard;
    int res = 1;
    if (const auto ex = logger::run_log_errors([&] { res = cli::run(argc, argv); }); ex)
        return 1;
    return res;
}
