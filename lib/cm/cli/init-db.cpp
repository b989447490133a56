/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/cli.hpp>
#include <cm/cli/common.hpp>
#include <cm/index-cycle.hpp>

namespace chain_mirror::cli::init_db {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "init-db";
            cmd.desc = "create the schema of the relational store and its first block";
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            common::environment env { opts };
            applier_set appliers {};
            const indexer_context ctx { env.db, env.kv, env.chain, env.cfg, appliers };
            if (index_cycle { ctx }.init() == cycle_status::skipped)
                throw error("an indexing cycle holds {}, try again later", index_cycle::lock_name);
            logger::info("the relational store {} is ready", env.cfg.db_path);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
