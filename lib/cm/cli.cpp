/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <iostream>
#include <cm/cli.hpp>

namespace chain_mirror::cli {
    // Exit codes
    static constexpr int exit_ok = 0;
    static constexpr int exit_failure = 1;
    // the persisted state is corrupted and requires an operator
    static constexpr int exit_invariant = 2;

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::ios_base::sync_with_stdio(false);
        std::map<std::string, command_meta> commands {};
        for (const auto &cmd: command_list) {
            command_meta meta { cmd };
            cmd->configure(meta.cfg);
            meta.cfg.opts.try_emplace("config-dir", "a directory with the configuration files");
            if (const auto [it, created] = commands.try_emplace(meta.cfg.name, std::move(meta)); !created) [[unlikely]]
                throw error("multiple definitions for {}", it->first);
        }
        if (argc < 2) {
            std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n" ;
            for (const auto &[name, meta]: commands)
                std::cerr << fmt::format("    {} {}\n", meta.cfg.name, meta.cfg.make_usage());
            return exit_failure;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("Unknown command {}", cmd);
            return exit_failure;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        try {
            const auto &meta = cmd_it->second;
            timer t { fmt::format("run {}", cmd), logger::level::info };
            const auto pr = meta.cmd->parse(meta.cfg, args);
            meta.cmd->run(pr.args, pr.opts);
        } catch (const invariant_error &ex) {
            logger::error("{}: the persisted state violates an invariant and requires an operator: {}", cmd, ex.what());
            return exit_invariant;
        } catch (const std::exception &ex) {
            logger::error("{}: {}", cmd, ex.what());
            return exit_failure;
        }
        return exit_ok;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
