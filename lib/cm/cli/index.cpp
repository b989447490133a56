/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/cli.hpp>
#include <cm/cli/common.hpp>
#include <cm/index-cycle.hpp>

namespace chain_mirror::cli::index {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "index";
            cmd.desc = "run one indexing cycle: revert the blocks that left the chain and apply the new ones";
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            common::environment env { opts };
            auto appliers = applier_registry::make_set();
            const indexer_context ctx { env.db, env.kv, env.chain, env.cfg, appliers };
            const auto res = index_cycle { ctx }.run();
            logger::info("index cycle {}: reverted: {} indexed: {}", res.status, res.num_reverted, res.num_indexed);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
