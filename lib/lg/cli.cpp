/* This file is part of listing-guard project.
 * Based on code of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lg/cli.hpp>

namespace listing_guard::cli {
    parse_result command::parse(const config &cfg, const arguments &args) const
    {
        parse_result pr {};
        for (const auto &arg: args) {
            if (!arg.starts_with("--")) {
                pr.args.emplace_back(arg);
                continue;
            }
            const auto eq_pos = arg.find('=', 2);
            const auto name = arg.substr(2, eq_pos == arg.npos ? arg.npos : eq_pos - 2);
            if (!cfg.opts.contains(name))
                throw error(fmt::format("unknown option '--{}'", name));
            std::optional<std::string> val {};
            if (eq_pos != arg.npos)
                val = arg.substr(eq_pos + 1);
            if (!pr.opts.try_emplace(name, std::move(val)).second)
                throw error(fmt::format("option '--{}' is given more than once", name));
        }
        for (const auto &[name, opt_cfg]: cfg.opts) {
            if (opt_cfg.default_value)
                pr.opts.try_emplace(name, *opt_cfg.default_value);
        }
        if ((cfg.args.min && pr.args.size() < *cfg.args.min) || (cfg.args.max && pr.args.size() > *cfg.args.max))
            throw error(fmt::format("usage: {} {}", cfg.name, cfg.make_usage()));
        return pr;
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::ios_base::sync_with_stdio(false);
        map<std::string, command_meta> commands {};
        for (const auto &cmd: command_list) {
            command_meta meta { cmd };
            cmd->configure(meta.cfg);
            const auto name = meta.cfg.name;
            if (const auto [it, created] = commands.try_emplace(name, std::move(meta)); !created) [[unlikely]]
                throw error(fmt::format("multiple definitions for {}", name));
        }
        if (argc < 2) {
            std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n" ;
            for (const auto &[name, cmd]: commands)
                std::cerr << fmt::format("    {} {}\n", cmd.cfg.name, cmd.cfg.make_usage());
            return 1;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("Unknown command {}", cmd);
            return 1;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        try {
            const auto &meta = cmd_it->second;
            timer t { fmt::format("run {}", cmd), logger::level::debug };
            const auto pr = meta.cmd->parse(meta.cfg, args);
            meta.cmd->run(pr.args, pr.opts);
        } catch (const command_failed &ex) {
            logger::info("{}: {}", cmd, ex.what());
            return 1;
        } catch (const std::exception &ex) {
            logger::error("{}: {}", cmd, ex.what());
            return 1;
        }
        return 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
